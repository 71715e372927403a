#include "logstream/pattern_filter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "my_error_codes.hpp"

namespace carrierctrl {
namespace logstream {

namespace {

std::string fold_case(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

} // namespace

std::optional<FilterScope> parse_scope(std::string_view name) {
  auto folded = fold_case(name);
  if (folded == "all") {
    return FilterScope::All;
  } else if (folded == "device") {
    return FilterScope::Device;
  } else if (folded == "process") {
    return FilterScope::Process;
  } else if (folded == "level") {
    return FilterScope::Level;
  } else if (folded == "message") {
    return FilterScope::Message;
  }
  return std::nullopt;
}

std::optional<MatchSyntax> parse_syntax(std::string_view name) {
  auto folded = fold_case(name);
  if (folded == "substring") {
    return MatchSyntax::Substring;
  } else if (folded == "regex") {
    return MatchSyntax::Regex;
  }
  return std::nullopt;
}

const char *to_string(FilterScope scope) {
  switch (scope) {
  case FilterScope::All:
    return "all";
  case FilterScope::Device:
    return "device";
  case FilterScope::Process:
    return "process";
  case FilterScope::Level:
    return "level";
  case FilterScope::Message:
    return "message";
  }
  return "all";
}

std::optional<SyslogFields> parse_syslog_line(std::string_view line) {
  static const std::regex layout(
      R"(^([A-Z][a-z]{2} +\d{1,2} \d{2}:\d{2}:\d{2}) (\S+) ([^\[]+)\[(\d+)\] <([A-Za-z]+)>: ?(.*)$)");
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_match(line.begin(), line.end(), m, layout)) {
    return std::nullopt;
  }
  SyslogFields fields;
  fields.timestamp = m[1].str();
  fields.device = m[2].str();
  fields.process = m[3].str();
  fields.level = m[5].str();
  fields.message = m[6].str();
  return fields;
}

PatternFilter::PatternFilter(FilterOptions options)
    : options_(std::move(options)) {}

Result<std::shared_ptr<PatternFilter>>
PatternFilter::create(FilterOptions options) {
  using R = Result<std::shared_ptr<PatternFilter>>;
  if (options.pattern.empty()) {
    return R::Err(make_error(my_errors::LOGSTREAM::FILTER_CONSTRUCTION,
                             "Filter pattern must not be empty."));
  }

  std::shared_ptr<PatternFilter> filter(new PatternFilter(std::move(options)));
  if (filter->options_.syntax == MatchSyntax::Regex) {
    auto flags = std::regex::ECMAScript;
    if (!filter->options_.case_sensitive) {
      flags |= std::regex::icase;
    }
    try {
      filter->regex_.emplace(filter->options_.pattern, flags);
    } catch (const std::regex_error &e) {
      return R::Err(make_error(
          my_errors::LOGSTREAM::FILTER_CONSTRUCTION,
          fmt::format("Invalid filter pattern '{}': {}",
                      filter->options_.pattern, e.what())));
    }
  } else if (!filter->options_.case_sensitive) {
    filter->folded_pattern_ = fold_case(filter->options_.pattern);
  }
  return R::Ok(std::move(filter));
}

bool PatternFilter::matches_text(std::string_view text) const {
  if (regex_) {
    return std::regex_search(text.begin(), text.end(), *regex_);
  }
  if (options_.case_sensitive) {
    return text.find(options_.pattern) != std::string_view::npos;
  }
  return fold_case(text).find(folded_pattern_) != std::string::npos;
}

bool PatternFilter::matches(std::string_view line) const {
  if (options_.scope == FilterScope::All) {
    return matches_text(line);
  }
  auto fields = parse_syslog_line(line);
  if (!fields) {
    return false;
  }
  switch (options_.scope) {
  case FilterScope::Device:
    return matches_text(fields->device);
  case FilterScope::Process:
    return matches_text(fields->process);
  case FilterScope::Level:
    return matches_text(fields->level);
  case FilterScope::Message:
    return matches_text(fields->message);
  case FilterScope::All:
    break;
  }
  return matches_text(line);
}

bool PatternFilter::offer(std::string_view line) {
  if (!active() || !matches(line)) {
    return false;
  }
  if (options_.mode == FilterMode::Persistent) {
    return true;
  }
  auto expected = FilterState::Active;
  return state_.compare_exchange_strong(expected, FilterState::Consumed);
}

} // namespace logstream
} // namespace carrierctrl
