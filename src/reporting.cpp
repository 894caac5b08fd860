#include "stressched/reporting.hpp"
#include "stressched/scheduler.hpp"
#include "stressched/time_utils.hpp"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stressched {
namespace reporting {

static std::atomic<bool> g_csv{false};
static std::atomic<bool> g_debug{false};
static std::mutex g_io;

void set_csv(bool value) {
    g_csv.store(value, std::memory_order_relaxed);
}

bool csv_enabled() {
    return g_csv.load(std::memory_order_relaxed);
}

void set_debug(bool value) {
    g_debug.store(value, std::memory_order_relaxed);
}

bool debug_enabled() {
    return g_debug.load(std::memory_order_relaxed);
}

void info(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] " << msg << std::endl;
}

void warn(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] [warn] " << msg << std::endl;
}

void error(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] [error] " << msg << std::endl;
}

void debug(const std::string& tag, const std::string& msg) {
    if (!debug_enabled()) return;
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] [debug] " << msg << std::endl;
}

namespace {

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string window_text(const ScheduleResult& r, const ScheduleItem& item) {
    if (!item.window || *item.window >= r.windows.size()) return "-";
    const auto& w = r.windows[*item.window];
    return w.label + " (" + time_utils::format_clock(w.start) + "-" + time_utils::format_clock(w.end) + ")";
}

} // namespace

void print_text(std::ostream& os, const ScheduleResult& r) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "=== Schedule (" << r.allocator << ") ===\n";
    for (const auto& item : r.items) {
        out << "- " << item.task.title << " [" << to_string(item.task.priority) << "] "
            << to_string(item.status) << " "
            << time_utils::format_duration(item.allocated_minutes) << "/"
            << time_utils::format_duration(item.task.estimated_duration_minutes)
            << " in " << window_text(r, item)
            << " confidence=" << item.confidence
            << " urgency=" << item.deadline_urgency << "\n";
        for (const auto& note : item.notes) out << "    " << note << "\n";
    }
    out << "\nStress: " << r.stress_analysis.level << "/10 (" << r.stress_analysis.mood << ") - "
        << r.stress_analysis.impact << "\n";
    out << "Actions:";
    for (const auto& a : r.stress_analysis.recommended_actions) out << " " << a;
    out << "\n";
    out << "Scheduled " << r.task_analysis.scheduled_tasks << "/" << r.task_analysis.total_tasks
        << " tasks, " << r.insights.total_work_hours << "h of work, average confidence "
        << r.insights.average_confidence << "\n";
    out << r.insights.mood_optimization << "\n";
    for (const auto& rec : r.insights.recommendations) out << "* " << rec << "\n";
    for (const auto& alert : r.workload_alerts) {
        out << "! " << alert.type << ": " << alert.message << " (" << alert.suggested_action << ")\n";
    }
    for (const auto& g : r.task_guidance) {
        if (g.item_index >= r.items.size()) continue;
        out << "> " << r.items[g.item_index].task.title << ":";
        for (size_t i = 0; i < g.tips.size(); ++i) out << (i == 0 ? " " : "; ") << g.tips[i];
        if (g.break_minutes > 0) out << (g.tips.empty() ? " " : "; ") << g.break_minutes << "m break after";
        out << "\n";
    }
    for (const auto& p : r.postponement_suggestions) {
        out << "~ postpone \"" << p.task_title << "\": " << p.reason << "; " << p.suggested_new_time << "\n";
    }
    os << out.str();
}

void print_csv(std::ostream& os, const ScheduleResult& r) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "id,title,status,allocated_minutes,requested_minutes,window,confidence,urgency\n";
    for (const auto& item : r.items) {
        std::string window = item.window && *item.window < r.windows.size() ? r.windows[*item.window].label : "";
        out << csv_field(item.task.id) << "," << csv_field(item.task.title) << ","
            << to_string(item.status) << "," << item.allocated_minutes << ","
            << item.task.estimated_duration_minutes << "," << csv_field(window) << ","
            << item.confidence << "," << item.deadline_urgency << "\n";
    }
    os << out.str();
}

void print_result(std::ostream& os, const ScheduleResult& result) {
    if (csv_enabled()) {
        print_csv(os, result);
    } else {
        print_text(os, result);
    }
}

} // namespace reporting
} // namespace stressched
