#ifndef SSHPROV_COMMON_LOGGER_HEADER
#define SSHPROV_COMMON_LOGGER_HEADER

#include "types.hpp"

#include <sstream>
#include <source_location>

namespace sshprov {

// very simple formatting, only {} placeholders
template<typename... Args>
std::string simple_format(std::string_view fmt, Args const&...);

class logger {
public:
	enum type {
		error         = 0x1,
		info          = 0x2,
		debug         = 0x4,
		debug_verbose = 0x08,
		debug_trace   = 0x10,

		log_none = 0,
		log_default = info | error,
		log_all = info | error | debug | debug_trace | debug_verbose
	};

	logger(type t = log_default)
	: level_(t)
	{}

	virtual ~logger() = default;

	logger(logger const&) = delete;
	logger& operator=(logger const&) = delete;

	struct log_type {
		log_type(logger::type t, std::source_location location = std::source_location::current())
		: type(t)
		, location(std::move(location))
		{}

		logger::type type;
		std::source_location location;
	};

	template<typename... Args>
	void log(log_type t, std::string_view fmt, Args&&... args)
	{
		if(would_log(t.type)) {
			do_log_line(t.type, format(fmt, std::forward<Args>(args)...), std::move(t.location));
		}
	}

	template<typename... Args>
	std::string format(std::string_view fmt, Args&&... args) const {
		return simple_format(fmt, std::forward<Args>(args)...);
	}

	void log_line(type t, std::string const& s, std::source_location&& l = std::source_location::current()) {
		if(would_log(t)) {
			do_log_line(t, s, std::move(l));
		}
	}

	bool would_log(type t) const {
		return t & level_;
	}

	void set_level(type t) {
		level_ = t;
	}

	type level() const {
		return level_;
	}

protected:
	virtual void do_log_line(type, std::string const&, std::source_location&&) = 0;

private:
	type level_{log_default};
};

// no escaping, extra arguments are ignored
template<typename... Args>
std::string simple_format(std::string_view fmt, Args const&... args) {
	std::ostringstream out;
	std::string_view::size_type pos = 0;

	auto replace = [&](auto&& arg) {
		if(pos != std::string_view::npos) {
			auto f = fmt.find("{}", pos);
			if(f != std::string_view::npos) {
				out << fmt.substr(pos, f-pos);
				out << arg;
				pos = f+2;
			}
		}
	};

	(replace(args), ...);

	if(pos < fmt.size()) {
		out << fmt.substr(pos);
	}

	return out.str();
}

class stdout_logger : public logger {
public:
	using logger::logger;

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
};

/// everything goes to stderr, keeps stdout free for machine readable output
class stderr_logger : public logger {
public:
	using logger::logger;

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
};

/// forwards to another logger with the tag prepended to every line
class session_logger : public logger {
public:
	session_logger(logger&, std::string tag);

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
private:
	logger& log_;
	std::string tag_;
};

}

#endif
