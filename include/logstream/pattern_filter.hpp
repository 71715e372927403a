#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "util/result.hpp"

namespace carrierctrl {
namespace logstream {

enum class FilterMode { OneShot, Persistent };
enum class MatchSyntax { Substring, Regex };
// Which part of a syslog line the pattern is tested against.
enum class FilterScope { All, Device, Process, Level, Message };
enum class FilterState { Active, Consumed };

std::optional<FilterScope> parse_scope(std::string_view name);
std::optional<MatchSyntax> parse_syntax(std::string_view name);
const char *to_string(FilterScope scope);

struct FilterOptions {
  std::string pattern;
  FilterMode mode{FilterMode::OneShot};
  MatchSyntax syntax{MatchSyntax::Substring};
  FilterScope scope{FilterScope::All};
  bool case_sensitive{false};
};

// "Mar  3 10:15:02 iPhone CommCenter(CoreTelephony)[81] <Notice>: text"
struct SyslogFields {
  std::string timestamp;
  std::string device;
  std::string process;
  std::string level;
  std::string message;
};

// nullopt when the line does not follow the device syslog layout.
std::optional<SyslogFields> parse_syslog_line(std::string_view line);

/**
 * Predicate over one log line.
 *
 * A OneShot filter accepts at most one line: the first successful offer()
 * flips it to Consumed atomically, so concurrent deliveries cannot both win.
 * Persistent filters stay Active until deactivate() is called.
 */
class PatternFilter {
public:
  // Errors with my_errors::LOGSTREAM::FILTER_CONSTRUCTION for an empty or
  // invalid pattern.
  static Result<std::shared_ptr<PatternFilter>> create(FilterOptions options);

  // Pure test, ignores the filter state.
  bool matches(std::string_view line) const;

  // Test and, for OneShot filters, consume. True if the line is accepted.
  bool offer(std::string_view line);

  void deactivate() { state_.store(FilterState::Consumed); }
  bool active() const { return state_.load() == FilterState::Active; }
  FilterState state() const { return state_.load(); }
  FilterMode mode() const { return options_.mode; }
  const FilterOptions &options() const { return options_; }

private:
  explicit PatternFilter(FilterOptions options);

  bool matches_text(std::string_view text) const;

  FilterOptions options_;
  std::string folded_pattern_;
  std::optional<std::regex> regex_;
  std::atomic<FilterState> state_{FilterState::Active};
};

using PatternFilterPtr = std::shared_ptr<PatternFilter>;

} // namespace logstream
} // namespace carrierctrl
