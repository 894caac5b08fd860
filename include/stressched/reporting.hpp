#pragma once
#include <iosfwd>
#include <string>

namespace stressched {

struct ScheduleResult;

namespace reporting {

void set_csv(bool value);
bool csv_enabled();

void set_debug(bool value);
bool debug_enabled();

// "[tag] msg" on stdout; warnings and errors go to stderr.
void info(const std::string& tag, const std::string& msg);
void warn(const std::string& tag, const std::string& msg);
void error(const std::string& tag, const std::string& msg);
void debug(const std::string& tag, const std::string& msg);

// Human-readable report, or CSV rows when csv_enabled().
void print_result(std::ostream& os, const ScheduleResult& result);
void print_text(std::ostream& os, const ScheduleResult& result);
// id,title,status,allocated_minutes,requested_minutes,window,confidence,urgency
void print_csv(std::ostream& os, const ScheduleResult& result);

} // namespace reporting
} // namespace stressched
