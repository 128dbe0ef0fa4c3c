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

#include <compdb/pg_testdb.hpp>
#include <compdb/pg_exception.hpp>
#include <compdb/pgconn_handle.hpp>
#include <compdb/pgresult_handle.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace compdb;

namespace {
  const char INITDB[] = "initdb";
  const char POSTMASTER[] = "postgres";

  bool
  is_executable(const std::string &path)
  {
    return access(path.c_str(), X_OK) == 0;
  }

  bool
  check_path(const std::string &path)
  {
    return is_executable(path + INITDB) && is_executable(path + POSTMASTER);
  }

  // Searches DIR for versioned subdirectories ("15", "pgsql-15")
  // containing the server binaries under SUFFIX.  Picks the highest
  // version.
  std::string
  search_versions(const char *dir, const char *strip, const char *suffix)
  {
    std::string best_candidate;
    DIR *d = opendir(dir);
    if (d == NULL) {
      return best_candidate;
    }
    double best_ver = 0.0;
    size_t strip_len = strlen(strip);
    while (dirent *e = readdir(d)) {
      if (strncmp(e->d_name, strip, strip_len) != 0) {
	continue;
      }
      double ver = 0.0;
      if (sscanf(e->d_name + strip_len, "%lf", &ver) != 1
	  || ver <= best_ver) {
	continue;
      }
      std::string candidate(dir);
      candidate += '/';
      candidate += e->d_name;
      candidate += suffix;
      if (check_path(candidate)) {
	best_candidate = candidate;
	best_ver = ver;
      }
    }
    closedir(d);
    return best_candidate;
  }

  // Returns the directory (with trailing slash) with the server
  // binaries, or the empty string.
  std::string
  postgresql_prefix()
  {
    std::string candidate("/usr/bin/");
    if (check_path(candidate)) {
      return candidate;
    }
    candidate = search_versions("/usr/lib/postgresql", "", "/bin/");
    if (candidate.empty()) {
      candidate = search_versions("/usr", "pgsql-", "/bin/");
    }
    return candidate;
  }

  void
  throw_errno(const char *function, const std::string &path)
    __attribute__((noreturn));
  void
  throw_errno(const char *function, const std::string &path)
  {
    std::string msg(function);
    msg += ": ";
    msg += path;
    msg += ": ";
    msg += strerror(errno);
    throw pg_exception(msg);
  }

  // Starts ARGV[0] with standard output and error redirected to
  // OUTFD, and standard input from /dev/null.
  pid_t
  spawn(const std::vector<std::string> &args, int outfd)
  {
    std::vector<char *> argv;
    for (std::vector<std::string>::const_iterator
	   p = args.begin(), end = args.end(); p != end; ++p) {
      argv.push_back(const_cast<char *>(p->c_str()));
    }
    argv.push_back(NULL);
    pid_t pid = fork();
    if (pid < 0) {
      throw_errno("fork", args.front());
    }
    if (pid == 0) {
      int nullfd = open("/dev/null", O_RDONLY);
      if (nullfd < 0 || dup2(nullfd, 0) < 0
	  || dup2(outfd, 1) < 0 || dup2(outfd, 2) < 0) {
	_exit(126);
      }
      execv(argv[0], &argv[0]);
      _exit(127);
    }
    return pid;
  }

  int
  wait_for(pid_t pid)
  {
    int status;
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) {
	return -1;
      }
    }
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    return -1;
  }

  int
  remove_entry(const char *path, const struct stat *, int, struct FTW *)
  {
    return remove(path);
  }
}

struct pg_testdb::impl {
  std::string program_prefix;
  std::string directory;
  std::string logfile;
  std::vector<std::string> notices;
  pid_t server;

  impl();
  ~impl();

  void make_directory();
  void initdb();
  void configure();
  void start();
  void wait_for_socket();
  void stop() throw();
  void remove_directory() throw();

  static void notice_processor(void *arg, const char *message);
};

pg_testdb::impl::impl()
  : program_prefix(postgresql_prefix()), server(-1)
{
  if (program_prefix.empty()) {
    throw pg_exception("could not locate PostgreSQL server binaries");
  }
  make_directory();
  try {
    initdb();
    configure();
    start();
    wait_for_socket();
  } catch (pg_exception &) {
    stop();
    remove_directory();
    throw;
  }
}

pg_testdb::impl::~impl()
{
  stop();
  remove_directory();
}

void
pg_testdb::impl::make_directory()
{
  const char *tmpdir = getenv("TMPDIR");
  std::string path(tmpdir != NULL && tmpdir[0] != '\0' ? tmpdir : "/tmp");
  path += "/pg_testdb-XXXXXX";
  std::vector<char> buf(path.begin(), path.end());
  buf.push_back('\0');
  if (mkdtemp(&buf[0]) == NULL) {
    throw_errno("mkdtemp", path);
  }
  directory = &buf[0];
  logfile = directory + "/server.log";
}

void
pg_testdb::impl::initdb()
{
  std::string datadir(directory + "/data");
  std::vector<std::string> args;
  args.push_back(program_prefix + INITDB);
  args.push_back("-A");
  args.push_back("trust");
  args.push_back("-D");
  args.push_back(datadir);
  args.push_back("-E");
  args.push_back("UTF8");
  args.push_back("--locale=C");
  std::string initlog(directory + "/initdb.log");
  int fd = open(initlog.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
		0600);
  if (fd < 0) {
    throw_errno("open", initlog);
  }
  int ret;
  try {
    ret = wait_for(spawn(args, fd));
  } catch (pg_exception &) {
    close(fd);
    throw;
  }
  close(fd);
  if (ret != 0) {
    throw pg_exception("initdb failed, see " + initlog);
  }
}

void
pg_testdb::impl::configure()
{
  std::string confpath(directory + "/data/postgresql.conf");
  FILE *conf = fopen(confpath.c_str(), "a");
  if (conf == NULL) {
    throw_errno("fopen", confpath);
  }
  fprintf(conf, "unix_socket_directories = '%s'\n", directory.c_str());
  fprintf(conf, "unix_socket_permissions = 0700\n");
  fprintf(conf, "listen_addresses = ''\n");
  fprintf(conf, "fsync = off\n");
  bool failed = ferror(conf);
  if (fclose(conf) != 0 || failed) {
    throw_errno("fprintf", confpath);
  }
}

void
pg_testdb::impl::start()
{
  int fd = open(logfile.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_TRUNC
		| O_CLOEXEC, 0600);
  if (fd < 0) {
    throw_errno("open", logfile);
  }
  std::vector<std::string> args;
  args.push_back(program_prefix + POSTMASTER);
  args.push_back("-D");
  args.push_back(directory + "/data");
  try {
    server = spawn(args, fd);
  } catch (pg_exception &) {
    close(fd);
    throw;
  }
  close(fd);
}

void
pg_testdb::impl::wait_for_socket()
{
  std::string socket(directory + "/.s.PGSQL.5432");
  for (unsigned i = 0; i < 150; ++i) {
    if (access(socket.c_str(), F_OK) == 0) {
      return;
    }
    usleep(100 * 1000);
  }
  throw pg_exception("socket did not appear at: " + socket);
}

void
pg_testdb::impl::stop() throw()
{
  if (server > 0) {
    // Immediate shutdown.  The data directory is discarded anyway.
    kill(server, SIGQUIT);
    wait_for(server);
    server = -1;
  }
}

void
pg_testdb::impl::remove_directory() throw()
{
  if (!directory.empty()
      && nftw(directory.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS) != 0) {
    fprintf(stderr, "warning: could not remove %s: %s\n",
	    directory.c_str(), strerror(errno));
  }
}

void
pg_testdb::impl::notice_processor(void *arg, const char *message)
{
  impl *impl_ = static_cast<impl *>(arg);
  try {
    impl_->notices.push_back(message);
  } catch (std::bad_alloc &) {
    fprintf(stderr, "warning: dropped PostgreSQL notice: %s", message);
  }
}

// Check that the server has come up.  The socket can be there, but
// the server still rejects incomming connections.
static void
wait_for_server(pg_testdb *db)
{
  for (unsigned i = 0; i < 150; ++i) {
    try {
      pgconn_handle handle(db->connect("template1"));
      break;
    } catch (pg_exception &e) {
      if (e.message_.find("the database system is starting up")
	  != std::string::npos) {
	usleep(100 * 1000);
	continue;
      }
      throw;
    }
  }
}

pg_testdb::pg_testdb()
  : impl_(new impl)
{
  try {
    wait_for_server(this);
  } catch (pg_exception &) {
    dump_logs();
    throw;
  }
}

pg_testdb::~pg_testdb()
{
}

bool
pg_testdb::available()
{
  return geteuid() != 0 && !postgresql_prefix().empty();
}

const std::vector<std::string> &
pg_testdb::notices() const
{
  return impl_->notices;
}

const std::string &
pg_testdb::directory()
{
  return impl_->directory;
}

const std::string &
pg_testdb::logfile()
{
  return impl_->logfile;
}

PGconn *
pg_testdb::connect(const char *dbname)
{
  static const char *keys[] = {
    "host", "port", "dbname", NULL
  };
  const char *values[] = {
    impl_->directory.c_str(), "5432", dbname, NULL
  };
  pgconn_handle handle(PQconnectdbParams(keys, values, 0));
  PQsetNoticeProcessor(handle.get(), impl::notice_processor, impl_.get());
  return handle.release();
}

void
pg_testdb::exec_test_sql(const char *dbname, const char *sql)
{
  pgconn_handle conn(connect(dbname));
  pgresult_handle res;
  res.exec(conn, sql);
}

void
pg_testdb::dump_logs()
{
  fprintf(stderr, "* PostgreSQL server log:\n");
  FILE *log = fopen(impl_->logfile.c_str(), "r");
  if (log == NULL) {
    fprintf(stderr, "warning: could not open %s: %s\n",
	    impl_->logfile.c_str(), strerror(errno));
    return;
  }
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), log)) > 0) {
    fwrite(buf, 1, n, stderr);
  }
  fclose(log);
}
