#include "wfsync/workflow/normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace wfsync::workflow {
namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

const std::vector<std::string>& WorkflowNormalizer::volatile_settings_keys() {
    static const std::vector<std::string> keys{
        "executionUrl",
        "availableInMCP",
        "callerPolicy",
        "saveDataErrorExecution",
        "saveManualExecutions",
        "saveExecutionProgress",
        "executionOrder"
    };
    return keys;
}

Document WorkflowNormalizer::clean_for_storage(const Document& workflow) {
    Document clean = Document::object();
    if (!workflow.is_object()) {
        clean["nodes"] = Document::array();
        clean["connections"] = Document::object();
        clean["settings"] = Document::object();
        clean["tags"] = Document::array();
        return clean;
    }

    Document settings = Document::object();
    auto settings_it = workflow.find("settings");
    if (settings_it != workflow.end() && settings_it->is_object()) {
        settings = *settings_it;
        for (const auto& key : volatile_settings_keys()) {
            settings.erase(key);
        }
    }

    auto copy_or = [&](const char* key, Document fallback) {
        auto it = workflow.find(key);
        if (it == workflow.end() || it->is_null()) {
            return fallback;
        }
        return *it;
    };

    auto name_it = workflow.find("name");
    if (name_it != workflow.end() && !name_it->is_null()) {
        clean["name"] = *name_it;
    }
    clean["nodes"] = copy_or("nodes", Document::array());
    clean["connections"] = copy_or("connections", Document::object());
    clean["settings"] = std::move(settings);
    clean["tags"] = copy_or("tags", Document::array());

    auto active_it = workflow.find("active");
    if (active_it != workflow.end() && !active_it->is_null()) {
        clean["active"] = *active_it;
    }
    return clean;
}

Document WorkflowNormalizer::clean_for_push(const Document& workflow) {
    Document clean = clean_for_storage(workflow);
    clean.erase("active");
    clean.erase("tags");
    return clean;
}

Document WorkflowNormalizer::to_local_file(const Document& workflow, const std::string& workflow_id) {
    Document file = clean_for_storage(workflow);
    if (!workflow_id.empty()) {
        file["id"] = workflow_id;
    }
    return file;
}

std::string WorkflowNormalizer::filename_for(const std::string& workflow_name) {
    std::string collapsed;
    collapsed.reserve(workflow_name.size() + 5);

    bool in_space = false;
    for (char c : workflow_name) {
        if (c == '/' || c == '\\' || c == ':') {
            c = '_';
        }
        if (is_space(c)) {
            if (!in_space) {
                collapsed.push_back(' ');
            }
            in_space = true;
            continue;
        }
        in_space = false;
        collapsed.push_back(c);
    }

    const auto first = collapsed.find_first_not_of(' ');
    if (first == std::string::npos) {
        // A bare ".json" would be a hidden file and never observed
        return "untitled.json";
    }
    const auto last = collapsed.find_last_not_of(' ');
    return collapsed.substr(first, last - first + 1) + ".json";
}

bool WorkflowNormalizer::should_ignore(const WorkflowSummary& summary,
                                       bool sync_inactive,
                                       const std::vector<std::string>& ignored_tags) {
    if (!sync_inactive && !summary.active) {
        return true;
    }
    for (const auto& tag : summary.tags) {
        const auto lowered = to_lower(tag);
        if (std::find(ignored_tags.begin(), ignored_tags.end(), lowered) != ignored_tags.end()) {
            return true;
        }
    }
    return false;
}

} // namespace wfsync::workflow
