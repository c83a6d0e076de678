#include "client_config.hpp"
#include "sshprov/common/util.hpp"

namespace sshprov {

std::optional<std::string> config_stanza::get(std::string_view keyword) const {
	for(auto&& d : directives) {
		if(iequals(d.keyword, keyword)) {
			return d.value;
		}
	}
	return std::nullopt;
}

// "Keyword value", "Keyword=value" and "Keyword = value" are all valid
static bool split_directive(std::string_view line, std::string_view& keyword, std::string_view& value) {
	auto end = line.find_first_of(" \t=");
	keyword = line.substr(0, end);
	if(keyword.empty()) {
		return false;
	}
	value = end == std::string_view::npos ? std::string_view{} : trim(line.substr(end));
	if(value.starts_with('=')) {
		value = trim(value.substr(1));
	}
	return true;
}

// patterns are separated by whitespace, double quotes group
static std::vector<std::string> split_patterns(std::string_view s) {
	std::vector<std::string> res;
	std::string cur;
	bool quoted = false;
	for(char c : s) {
		if(c == '"') {
			quoted = !quoted;
		} else if(!quoted && (c == ' ' || c == '\t')) {
			if(!cur.empty()) {
				res.push_back(std::move(cur));
				cur.clear();
			}
		} else {
			cur += c;
		}
	}
	if(!cur.empty()) {
		res.push_back(std::move(cur));
	}
	return res;
}

client_config client_config::parse(std::string_view text, logger& log) {
	client_config res;
	res.stanzas_.emplace_back();

	std::size_t line_no = 0;
	for(auto line : split_lines(text)) {
		++line_no;
		line = trim(line);
		if(line.empty() || line.front() == '#') {
			continue;
		}

		std::string_view keyword, value;
		if(!split_directive(line, keyword, value)) {
			log.log(logger::debug, "skipping malformed config line {}", line_no);
			continue;
		}

		if(iequals(keyword, "Host") || iequals(keyword, "Match")) {
			config_stanza s;
			s.kind = iequals(keyword, "Host") ? config_stanza::host : config_stanza::match;
			s.patterns = split_patterns(value);
			s.line = line_no;
			res.stanzas_.push_back(std::move(s));
		} else {
			res.stanzas_.back().directives.push_back(config_directive{std::string(keyword), std::string(value)});
		}
	}

	return res;
}

config_stanza const* client_config::find_host(std::string_view host) const {
	for(auto&& s : stanzas_) {
		if(s.kind != config_stanza::host) {
			continue;
		}
		bool match = false;
		bool negated = false;
		for(auto&& p : s.patterns) {
			std::string_view pattern = p;
			if(pattern.starts_with('!')) {
				negated = negated || iequals(pattern.substr(1), host);
			} else if(iequals(pattern, host)) {
				match = true;
			}
		}
		if(match && !negated) {
			return &s;
		}
	}
	return nullptr;
}

static std::string quote_if_needed(std::string const& s) {
	if(s.find_first_of(" \t") != std::string::npos) {
		return '"' + s + '"';
	}
	return s;
}

std::string render_host_stanza(host_stanza_params const& p) {
	std::string res;
	res += "\nHost " + p.host + "\n";
	res += "    HostName " + p.host_name + "\n";
	res += "    IdentityFile " + quote_if_needed(p.identity_file) + "\n";
	res += "    User " + p.user + "\n";
	return res;
}

std::string_view unquote(std::string_view value) {
	if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
		value = value.substr(1, value.size() - 2);
	}
	return value;
}

}
