/*
 * Copyright (C) 2023 Red Hat, Inc.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include <compdb/database.hpp>
#include <compdb/fixture.hpp>
#include <compdb/latest_resolver.hpp>
#include <compdb/options.hpp>
#include <compdb/pg_exception.hpp>
#include <compdb/query_error.hpp>
#include <compdb/rpm_evr.hpp>
#include <compdb/string_support.hpp>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <memory>
#include <string>
#include <vector>

using namespace compdb;

namespace {
  // Arguments of --latest and --latest-components.
  struct query_args {
    std::string scope;
    std::string ofuri;
    std::string type;
    std::string ns;
    std::string name;
    std::string arch;

    taxonomy_scope to_scope(const compdb_options &opt) const
    {
      return taxonomy_scope(scope_type_from_string(scope), ofuri,
			    opt.include_inactive);
    }
  };
}

static database *
open_database(const compdb_options &opt)
{
  std::unique_ptr<database> db;
  if (opt.database.empty()) {
    db.reset(new database);
  } else {
    db.reset(new database(opt.database.c_str()));
  }
  if (opt.timeout > 0) {
    db->set_statement_timeout(opt.timeout);
  }
  return db.release();
}

static int
do_create_schema(const compdb_options &opt)
{
  std::unique_ptr<database> db(open_database(opt));
  db->create_schema();
  return 0;
}

static int
do_compare_versions(const compdb_options &, char **argv)
{
  printf("%d\n", vercmp(argv[0], argv[1]));
  return 0;
}

static rpm_evr
evr_argument(const char *arg)
{
  rpm_evr evr;
  if (!parse_evr(arg, evr)) {
    throw compdb_options::usage_error
      ("invalid EVR: \"" + quote(arg) + "\"");
  }
  return evr;
}

static int
do_compare_evr(const compdb_options &opt, char **argv)
{
  rpm_evr left(evr_argument(argv[0]));
  rpm_evr right(evr_argument(argv[1]));
  if (opt.output == compdb_options::verbose) {
    fprintf(stderr, "info: comparing %s with %s\n",
	    left.to_string().c_str(), right.to_string().c_str());
  }
  printf("%d\n", left.compare(right));
  return 0;
}

static int
do_latest(const compdb_options &opt, const query_args &args)
{
  latest_query query
    (args.to_scope(opt),
     component_identity(component_namespace_from_string(args.ns),
			args.name, args.type, args.arch));
  query.check();
  std::unique_ptr<database> db(open_database(opt));
  database::source source(*db);
  component_version result;
  if (resolve_latest(source, query, result, opt.tie)) {
    printf("%s\t%s\n", result.id.value().c_str(), result.nevra().c_str());
  } else if (opt.output == compdb_options::verbose) {
    fprintf(stderr, "info: no %s component %s (%s) in %s %s\n",
	    to_string(query.identity.ns), query.identity.name.c_str(),
	    query.identity.arch.c_str(), to_string(query.scope.type),
	    query.scope.ofuri.c_str());
  }
  return 0;
}

static int
do_latest_components(const compdb_options &opt, const query_args &args)
{
  taxonomy_scope scope(args.to_scope(opt));
  scope.check();
  std::unique_ptr<database> db(open_database(opt));
  database::source source(*db);
  std::vector<component_version> latest;
  std::vector<component_version> superseded;
  resolve_latest_components(source, scope, latest, superseded, opt.tie);
  const std::vector<component_version> &result
    (opt.superseded ? superseded : latest);
  for (std::vector<component_version>::const_iterator
	 p = result.begin(), end = result.end(); p != end; ++p) {
    printf("%s\t%s\t%s\t%s\n", p->id.value().c_str(),
	   to_string(p->identity.ns), p->identity.type.c_str(),
	   p->nevra().c_str());
  }
  if (opt.output == compdb_options::verbose) {
    fprintf(stderr, "info: %zu latest, %zu superseded components\n",
	    latest.size(), superseded.size());
  }
  return 0;
}

static int
do_load_fixture(const compdb_options &opt, char **argv)
{
  std::vector<fixture_entry> entries;
  for (; *argv; ++argv) {
    if (opt.output != compdb_options::quiet) {
      fprintf(stderr, "info: reading %s\n", *argv);
    }
    read_fixture(*argv, entries);
  }
  std::unique_ptr<database> db(open_database(opt));
  load_fixture(*db, entries);
  if (opt.output != compdb_options::quiet) {
    fprintf(stderr, "info: loaded %zu fixture entries\n", entries.size());
  }
  return 0;
}

static void
usage(const char *progname, const char *error = NULL)
{
  if (error) {
    fprintf(stderr, "error: %s\n", error);
  }
  fprintf(stderr, "Usage:\n\n"
"  %1$s --create-schema [OPTIONS]\n"
"  %1$s --compare-versions VERSION VERSION\n"
"  %1$s --compare-evr [EPOCH:]VERSION[-RELEASE] [EPOCH:]VERSION[-RELEASE]\n"
"  %1$s --latest --scope=TYPE --ofuri=URI --type=TYPE --namespace=NS\n"
"      --name=NAME --arch=ARCH [OPTIONS]\n"
"  %1$s --latest-components --scope=TYPE --ofuri=URI [OPTIONS]\n"
"  %1$s --load-fixture [OPTIONS] FILE...\n"
"\nScope types: Product, ProductVersion, ProductStream, ProductVariant\n"
"Namespaces: REDHAT, UPSTREAM\n"
"\nOptions:\n"
"  --database=CONNINFO    libpq connection string (default: PG* variables)\n"
"  --include-inactive     include components of inactive product streams\n"
"  --tie-break=POLICY     last-visited (default) or lowest-id\n"
"  --timeout=MS           statement timeout in milliseconds\n"
"  --superseded           list superseded instead of latest components\n"
"  --quiet, -q            less output\n"
"  --verbose, -v          more verbose output\n\n",
	  progname);
  exit(2);
}

namespace {
  namespace command {
    typedef enum {
      undefined = 1000,
      create_schema,
      compare_versions,
      compare_evr,
      latest,
      latest_components,
      load_fixture,
    } type;
  };
  namespace options {
    enum {
      undefined = 2000,
      database,
      include_inactive,
      tie_break,
      timeout,
      superseded,
      scope,
      ofuri,
      type,
      ns,
      name,
      arch,
    };
  }
}

int
main(int argc, char **argv)
{
  compdb_options opt;
  command::type cmd = command::undefined;
  query_args args;
  try {
    static const struct option long_options[] = {
      {"create-schema", no_argument, 0, command::create_schema},
      {"compare-versions", no_argument, 0, command::compare_versions},
      {"compare-evr", no_argument, 0, command::compare_evr},
      {"latest", no_argument, 0, command::latest},
      {"latest-components", no_argument, 0, command::latest_components},
      {"load-fixture", no_argument, 0, command::load_fixture},
      {"database", required_argument, 0, options::database},
      {"include-inactive", no_argument, 0, options::include_inactive},
      {"tie-break", required_argument, 0, options::tie_break},
      {"timeout", required_argument, 0, options::timeout},
      {"superseded", no_argument, 0, options::superseded},
      {"scope", required_argument, 0, options::scope},
      {"ofuri", required_argument, 0, options::ofuri},
      {"type", required_argument, 0, options::type},
      {"namespace", required_argument, 0, options::ns},
      {"name", required_argument, 0, options::name},
      {"arch", required_argument, 0, options::arch},
      {"verbose", no_argument, 0, 'v'},
      {"quiet", no_argument, 0, 'q'},
      {0, 0, 0, 0}
    };
    int ch;
    int index;
    while ((ch = getopt_long(argc, argv, "qv",
			     long_options, &index)) != -1) {
      switch (ch) {
      case 'q':
	opt.output = compdb_options::quiet;
	break;
      case 'v':
	opt.output = compdb_options::verbose;
	break;
      case command::create_schema:
      case command::compare_versions:
      case command::compare_evr:
      case command::latest:
      case command::latest_components:
      case command::load_fixture:
	if (cmd != command::undefined) {
	  usage(argv[0], "multiple commands");
	}
	cmd = static_cast<command::type>(ch);
	break;
      case options::database:
	opt.database = optarg;
	break;
      case options::include_inactive:
	opt.include_inactive = true;
	break;
      case options::tie_break:
	opt.set_tie_break(optarg);
	break;
      case options::timeout:
	opt.set_timeout(optarg);
	break;
      case options::superseded:
	opt.superseded = true;
	break;
      case options::scope:
	args.scope = optarg;
	break;
      case options::ofuri:
	args.ofuri = optarg;
	break;
      case options::type:
	args.type = optarg;
	break;
      case options::ns:
	args.ns = optarg;
	break;
      case options::name:
	args.name = optarg;
	break;
      case options::arch:
	args.arch = optarg;
	break;
      default:
	usage(argv[0]);
      }
    }
  } catch (compdb_options::usage_error &e) {
    usage(argv[0], e.what());
  }
  if (cmd == command::undefined) {
    usage(argv[0]);
  }
  switch (cmd) {
  case command::create_schema:
  case command::latest:
  case command::latest_components:
    if (argc != optind) {
      usage(argv[0]);
    }
    break;
  case command::compare_versions:
  case command::compare_evr:
    if (argc - optind != 2) {
      usage(argv[0]);
    }
    break;
  case command::load_fixture:
    if (argc == optind) {
      usage(argv[0]);
    }
    break;
  case command::undefined:
    break;
  }
  if (cmd == command::latest
      && (args.scope.empty() || args.ofuri.empty() || args.type.empty()
	  || args.ns.empty() || args.name.empty() || args.arch.empty())) {
    usage(argv[0], "--latest requires --scope, --ofuri, --type, "
	  "--namespace, --name, --arch");
  }
  if (cmd == command::latest_components
      && (args.scope.empty() || args.ofuri.empty())) {
    usage(argv[0], "--latest-components requires --scope, --ofuri");
  }

  try {
    switch (cmd) {
    case command::create_schema:
      return do_create_schema(opt);
    case command::compare_versions:
      return do_compare_versions(opt, argv + optind);
    case command::compare_evr:
      return do_compare_evr(opt, argv + optind);
    case command::latest:
      return do_latest(opt, args);
    case command::latest_components:
      return do_latest_components(opt, args);
    case command::load_fixture:
      return do_load_fixture(opt, argv + optind);
    case command::undefined:
      break;
    }
  } catch (compdb_options::usage_error &e) {
    fprintf(stderr, "error: %s\n", e.what());
    return 2;
  } catch (query_error &e) {
    fprintf(stderr, "error: %s\n", e.what());
    return 2;
  } catch (pg_exception &e) {
    if (e.query_canceled() && opt.timeout > 0) {
      fprintf(stderr, "error: query exceeded --timeout=%u\n", opt.timeout);
      if (opt.output != compdb_options::verbose) {
	return 1;
      }
    }
    fprintf(stderr, "error: from PostgreSQL:\n");
    dump("error: ", e, stderr);
    return 1;
  }
  return 1;
}
