#include "stressched/input.hpp"
#include "stressched/reporting.hpp"
#include "stressched/scheduler.hpp"
#include "stressched/time_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace stressched;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --tasks=FILE --slots=FILE [--stress=0..10] [--mood=TAG] "
              << "[--date=YYYY-MM-DD] [--now=YYYY-MM-DDTHH:MM]\n";
    std::cout << "  task lines:   title | duration | priority | deadline\n";
    std::cout << "  slot lines:   HH:MM-HH:MM [label]\n";
    std::cout << "  --csv-report  emit one CSV row per task instead of the text report\n";
    std::cout << "  --debug       log scheduling phases\n";
}

bool parse_level(const std::string& value, int& out) {
    if (value.empty() || value.size() > 2) return false;
    int result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return false;
        result = result * 10 + (c - '0');
    }
    out = result;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string tasks_path;
    std::string slots_path;
    std::string date_text;
    std::string now_text;
    StressContext stress;
    bool csv_report = false;
    bool debug = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg.rfind("--tasks=", 0) == 0) {
            tasks_path = arg.substr(sizeof("--tasks=") - 1);
            continue;
        }
        if (arg.rfind("--slots=", 0) == 0) {
            slots_path = arg.substr(sizeof("--slots=") - 1);
            continue;
        }
        if (arg.rfind("--stress=", 0) == 0) {
            if (!parse_level(arg.substr(sizeof("--stress=") - 1), stress.level)) {
                std::cerr << "Invalid stress level: " << arg << "\n";
                return 1;
            }
            continue;
        }
        if (arg.rfind("--mood=", 0) == 0) {
            stress.mood = arg.substr(sizeof("--mood=") - 1);
            continue;
        }
        if (arg.rfind("--date=", 0) == 0) {
            date_text = arg.substr(sizeof("--date=") - 1);
            continue;
        }
        if (arg.rfind("--now=", 0) == 0) {
            now_text = arg.substr(sizeof("--now=") - 1);
            continue;
        }
        if (arg == "--csv-report") {
            csv_report = true;
            continue;
        }
        if (arg == "--debug") {
            debug = true;
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (tasks_path.empty() || slots_path.empty()) {
        std::cerr << "Missing --tasks=FILE or --slots=FILE\n";
        print_usage(argv[0]);
        return 1;
    }

    reporting::set_csv(csv_report);
    reporting::set_debug(debug);

    ScheduleRequest req;
    if (!now_text.empty()) {
        auto now = time_utils::parse_timestamp(now_text);
        if (!now) {
            std::cerr << "Invalid --now timestamp: " << now_text << "\n";
            return 1;
        }
        req.now = *now;
    }
    TimePoint day = time_utils::start_of_day(req.now);
    if (!date_text.empty()) {
        auto parsed = time_utils::parse_timestamp(date_text);
        if (!parsed) {
            std::cerr << "Invalid --date: " << date_text << "\n";
            return 1;
        }
        day = time_utils::start_of_day(*parsed);
    }

    auto tasks_text = input::read_file(tasks_path);
    if (!tasks_text) {
        reporting::error("runner", "cannot read " + tasks_path);
        return 1;
    }
    auto slots_text = input::read_file(slots_path);
    if (!slots_text) {
        reporting::error("runner", "cannot read " + slots_path);
        return 1;
    }

    req.tasks = input::parse_tasks(*tasks_text);
    req.windows = input::parse_slots(*slots_text, day);
    req.stress = stress;
    reporting::debug("runner", "loaded " + std::to_string(req.tasks.size()) + " tasks and "
                     + std::to_string(req.windows.size()) + " slots for "
                     + time_utils::format_timestamp(day).substr(0, 10));

    Scheduler sched;
    try {
        auto result = sched.schedule(req);
        reporting::print_result(std::cout, result);
    } catch (const ValidationError& e) {
        reporting::error("runner", e.what());
        return 1;
    }
    return 0;
}
