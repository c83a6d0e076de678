#include "process.hpp"

#include <asio.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <functional>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sshprov {

std::string process_result::status() const {
	if(!launched) {
		return "not started";
	}
	if(timed_out) {
		return "timed out";
	}
	if(signal) {
		return "killed by signal " + std::to_string(signal);
	}
	return "exit status " + std::to_string(exit_code);
}

std::string command_line(std::vector<std::string> const& argv) {
	std::string res;
	for(auto&& a : argv) {
		if(!res.empty()) {
			res += ' ';
		}
		res += a;
	}
	return res;
}

namespace {

struct pipe_fds {
	pipe_fds() = default;
	~pipe_fds() {
		close_read();
		close_write();
	}

	pipe_fds(pipe_fds const&) = delete;
	pipe_fds& operator=(pipe_fds const&) = delete;

	bool open() {
		int fds[2];
		if(::pipe2(fds, O_CLOEXEC) != 0) {
			return false;
		}
		read = fds[0];
		write = fds[1];
		return true;
	}

	int release_read() {
		int r = read;
		read = -1;
		return r;
	}

	void close_read() {
		if(read >= 0) {
			::close(read);
			read = -1;
		}
	}

	void close_write() {
		if(write >= 0) {
			::close(write);
			write = -1;
		}
	}

	int read{-1};
	int write{-1};
};

class pipe_reader {
public:
	pipe_reader(asio::io_context& io, std::string& out)
	: sd_(io)
	, out_(out)
	{}

	// takes ownership of fd on success
	bool assign(int fd, asio::error_code& ec) {
		sd_.assign(fd, ec);
		return !ec;
	}

	void start(std::function<void()> on_done) {
		on_done_ = std::move(on_done);
		read();
	}

	void close() {
		asio::error_code ec;
		sd_.close(ec);
	}

	bool done() const { return done_; }

private:
	void read() {
		sd_.async_read_some(asio::buffer(buf_),
			[this](asio::error_code const& ec, std::size_t n) {
				out_.append(buf_.data(), n);
				if(ec) {
					done_ = true;
					on_done_();
				} else {
					read();
				}
			});
	}

private:
	asio::posix::stream_descriptor sd_;
	std::string& out_;
	std::array<char, 4096> buf_;
	std::function<void()> on_done_;
	bool done_{};
};

// environment for the child: inherited entries with the overrides replaced or added
std::vector<std::string> child_environment(std::map<std::string, std::string> const& overrides) {
	std::vector<std::string> res;
	for(char** e = environ; e && *e; ++e) {
		std::string_view entry(*e);
		auto name = entry.substr(0, entry.find('='));
		if(overrides.find(std::string(name)) == overrides.end()) {
			res.emplace_back(entry);
		}
	}
	for(auto&& [name, value] : overrides) {
		res.push_back(name + "=" + value);
	}
	return res;
}

std::vector<char*> to_c_array(std::vector<std::string>& v) {
	std::vector<char*> res;
	res.reserve(v.size() + 1);
	for(auto& s : v) {
		res.push_back(s.data());
	}
	res.push_back(nullptr);
	return res;
}

std::string errno_message(int e) {
	return std::error_code(e, std::generic_category()).message();
}

pid_t wait_child(pid_t pid, int& status, int options) {
	pid_t w;
	do {
		w = ::waitpid(pid, &status, options);
	} while(w < 0 && errno == EINTR);
	return w;
}

}

process_result run_process(std::vector<std::string> const& argv, process_options const& opts, logger& log) {
	process_result res;
	if(argv.empty() || argv.front().empty()) {
		res.error = "no program given";
		return res;
	}

	log.log(logger::debug_verbose, "running: {}", command_line(argv));

	pipe_fds out, err, exec_status;
	if(!out.open() || !err.open() || !exec_status.open()) {
		res.error = "failed to create pipes: " + errno_message(errno);
		return res;
	}

	// everything the child needs is prepared before fork
	std::vector<std::string> args(argv);
	auto c_args = to_c_array(args);
	std::vector<std::string> env = child_environment(opts.env);
	auto c_env = to_c_array(env);

	pid_t pid = ::fork();
	if(pid < 0) {
		res.error = "fork failed: " + errno_message(errno);
		return res;
	}

	if(pid == 0) {
		// dup2 clears O_CLOEXEC on the new descriptors
		if(::dup2(out.write, STDOUT_FILENO) < 0 || ::dup2(err.write, STDERR_FILENO) < 0) {
			int e = errno;
			(void)!::write(exec_status.write, &e, sizeof(e));
			::_exit(127);
		}
		environ = c_env.data();
		::execvp(c_args[0], c_args.data());
		int e = errno;
		(void)!::write(exec_status.write, &e, sizeof(e));
		::_exit(127);
	}

	out.close_write();
	err.close_write();
	exec_status.close_write();

	// exec_status is closed on successful exec, otherwise we get the errno
	int exec_errno = 0;
	ssize_t n;
	do {
		n = ::read(exec_status.read, &exec_errno, sizeof(exec_errno));
	} while(n < 0 && errno == EINTR);

	if(n == sizeof(exec_errno)) {
		int status = 0;
		wait_child(pid, status, 0);
		res.error = "failed to launch '" + argv.front() + "': " + errno_message(exec_errno);
		log.log(logger::debug, "{}", res.error);
		return res;
	}

	res.launched = true;

	int status = 0;
	bool reaped = false;
	{
		asio::io_context io;
		pipe_reader out_reader(io, res.out);
		pipe_reader err_reader(io, res.err);

		asio::error_code ec;
		if(out_reader.assign(out.read, ec)) {
			out.release_read();
			if(err_reader.assign(err.read, ec)) {
				err.release_read();
			}
		}
		if(ec) {
			::kill(pid, SIGKILL);
			wait_child(pid, status, 0);
			res.launched = false;
			res.error = "failed to read output of '" + argv.front() + "': " + ec.message();
			return res;
		}

		asio::steady_timer deadline(io);
		asio::steady_timer reap_timer(io);
		bool const has_deadline = opts.timeout.count() > 0;

		// the child may keep running after closing its output, the deadline stays armed until it is reaped
		std::function<void()> poll_child;
		poll_child = [&] {
			pid_t w = wait_child(pid, status, WNOHANG);
			if(w != 0) {
				reaped = w == pid;
				deadline.cancel();
				return;
			}
			reap_timer.expires_after(10ms);
			reap_timer.async_wait([&](asio::error_code const& e) {
				if(!e) {
					poll_child();
				}
			});
		};

		auto on_done = [&] {
			if(out_reader.done() && err_reader.done() && has_deadline && !res.timed_out) {
				poll_child();
			}
		};

		out_reader.start(on_done);
		err_reader.start(on_done);

		if(has_deadline) {
			deadline.expires_after(opts.timeout);
			deadline.async_wait([&](asio::error_code const& e) {
				if(!e) {
					log.log(logger::debug, "'{}' did not finish in {} ms, killing it", argv.front(), opts.timeout.count());
					::kill(pid, SIGKILL);
					res.timed_out = true;
					reap_timer.cancel();
					// a grandchild may still hold the pipes
					out_reader.close();
					err_reader.close();
				}
			});
		}

		io.run();
	}

	if(!reaped && wait_child(pid, status, 0) < 0) {
		int e = errno;
		res.error = "waitpid failed: " + errno_message(e);
		res.launched = false;
		return res;
	}

	if(WIFEXITED(status)) {
		res.exit_code = WEXITSTATUS(status);
	} else if(WIFSIGNALED(status)) {
		res.signal = WTERMSIG(status);
	}

	log.log(logger::debug_verbose, "'{}' finished with {}", argv.front(), res.status());
	return res;
}

}
