#include "stressched/scoring.hpp"
#include "stressched/reporting.hpp"
#include "stressched/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace stressched {

namespace {

struct KeywordGroup {
    TaskType type;
    std::array<const char*, 3> words;
};

const std::array<const char*, 5> kComplexWords = {"analysis", "research", "development", "complex", "detailed"};
const std::array<const char*, 5> kSimpleWords = {"update", "check", "review", "simple", "quick"};

// Checked in order, first hit wins.
const std::array<KeywordGroup, 3> kTypeGroups = {{
    {TaskType::DEEP_WORK, {"code", "develop", "analysis"}},
    {TaskType::CREATIVE, {"design", "create", "brainstorm"}},
    {TaskType::ADMINISTRATIVE, {"email", "meeting", "plan"}},
}};

std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Words>
bool contains_any(const std::string& haystack, const Words& words) {
    for (const char* w : words) {
        if (haystack.find(w) != std::string::npos) return true;
    }
    return false;
}

} // namespace

const char* to_string(TaskType t) {
    switch (t) {
    case TaskType::DEEP_WORK: return "deep_work";
    case TaskType::CREATIVE: return "creative";
    case TaskType::ADMINISTRATIVE: return "administrative";
    case TaskType::ROUTINE: break;
    }
    return "routine";
}

namespace scoring {

double deadline_urgency(const Task& task, TimePoint now) {
    if (!task.deadline || task.deadline->empty()) return 0.2;
    // epoch seconds, so deadlines far outside the clock's range still compare
    auto deadline = time_utils::parse_epoch_seconds(*task.deadline);
    if (!deadline) {
        reporting::debug("scoring", "unparseable deadline \"" + *task.deadline + "\" for \"" + task.title + "\"");
        return 0.2;
    }
    double hours = static_cast<double>(*deadline * 1000 - time_utils::epoch_millis(now)) / 3600000.0;
    if (hours <= 6) return 1.0;
    if (hours <= 24) return 0.9;
    if (hours <= 48) return 0.7;
    if (hours <= 168) return 0.5;
    return 0.3;
}

double importance(Priority p) {
    switch (p) {
    case Priority::HIGH: return 1.0;
    case Priority::LOW: return 0.3;
    case Priority::MEDIUM: return 0.6;
    }
    return 0.6;
}

double complexity(const std::string& title) {
    std::string t = lower(title);
    double value = 0.5;
    if (contains_any(t, kComplexWords)) value += 0.2;
    if (contains_any(t, kSimpleWords)) value -= 0.2;
    return std::clamp(value, 0.1, 1.0);
}

TaskType classify(const std::string& title) {
    std::string t = lower(title);
    for (const auto& group : kTypeGroups) {
        if (contains_any(t, group.words)) return group.type;
    }
    return TaskType::ROUTINE;
}

double stress_compatibility(double complexity, int stress_level) {
    return std::max(0.1, 1.0 - (complexity * stress_level / 10.0 * 0.7));
}

double final_priority(double urgency, double importance, double compatibility) {
    return urgency * kUrgencyWeight + importance * kImportanceWeight + compatibility * kCompatibilityWeight;
}

} // namespace scoring

ScoredTask score(const Task& task, int stress_level, TimePoint now, size_t input_index) {
    ScoredTask s;
    s.task = task;
    s.input_index = input_index;
    s.deadline_urgency = scoring::deadline_urgency(task, now);
    s.importance = scoring::importance(task.priority);
    s.complexity = scoring::complexity(task.title);
    s.task_type = scoring::classify(task.title);
    s.stress_compatibility = scoring::stress_compatibility(s.complexity, stress_level);
    s.final_priority = scoring::final_priority(s.deadline_urgency, s.importance, s.stress_compatibility);
    return s;
}

std::vector<ScoredTask> score_all(const std::vector<Task>& tasks, int stress_level, TimePoint now) {
    std::vector<ScoredTask> out;
    out.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) out.push_back(score(tasks[i], stress_level, now, i));
    std::stable_sort(out.begin(), out.end(), [](const ScoredTask& a, const ScoredTask& b) {
        return a.final_priority > b.final_priority;
    });
    return out;
}

} // namespace stressched
