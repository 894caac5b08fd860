#include "stressched/reporting.hpp"
#include "stressched/scheduler.hpp"
#include "stressched/time_utils.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace stressched;

static int parse_stress(int argc, char** argv) {
    int level = 6;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind("--stress=", 0) == 0) level = std::stoi(a.substr(sizeof("--stress=") - 1));
        if (a == "--debug") reporting::set_debug(true);
    }
    return level;
}

int main(int argc, char** argv) {
    using namespace std::chrono_literals;
    auto now = *time_utils::parse_timestamp("2025-10-13T08:00:00");

    auto window = [&](const char* from, const char* to, const char* label) {
        TimeWindow w;
        w.start = *time_utils::at_time_of_day(now, from);
        w.end = *time_utils::at_time_of_day(now, to);
        w.label = label;
        return w;
    };

    std::vector<TimeWindow> windows = {
        window("09:00", "11:00", "Morning work block"),
        window("13:00", "15:00", "Afternoon work block"),
        window("16:00", "17:00", "Evening work block"),
    };

    std::vector<Task> tasks(4);
    tasks[0].title = "Complete project report";
    tasks[0].estimated_duration_minutes = 120;
    tasks[0].priority = Priority::HIGH;
    tasks[0].deadline = time_utils::format_timestamp(now + 24h);

    tasks[1].title = "Quick email check";
    tasks[1].estimated_duration_minutes = 30;
    tasks[1].priority = Priority::LOW;

    tasks[2].title = "Research paper analysis";
    tasks[2].estimated_duration_minutes = 90;
    tasks[2].deadline = time_utils::format_timestamp(now + 72h);

    tasks[3].title = "Design review meeting";
    tasks[3].estimated_duration_minutes = 60;
    tasks[3].priority = Priority::HIGH;
    tasks[3].deadline = time_utils::format_timestamp(now + 4h);

    try {
        auto result = schedule(tasks, windows, parse_stress(argc, argv), "focused", now);
        reporting::print_result(std::cout, result);
    } catch (const std::exception& e) {
        reporting::error("demo", e.what());
        return 1;
    }
    return 0;
}
