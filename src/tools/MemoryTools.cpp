#include "tools/MemoryTools.h"
#include "utils/Logger.h"
#include <sstream>
#include <unordered_set>

namespace {

std::string joinTags(const std::vector<std::string>& tags) {
    std::string out;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) out += ", ";
        out += tags[i];
    }
    return out;
}

nlohmann::json tagsProperty(const std::string& description) {
    return {
        {"type", "array"},
        {"description", description},
        {"items", {{"type", "string"}}}
    };
}

} // namespace

// ========== remember ==========

RememberTool::RememberTool(IStore& store, std::string workDir, Limits limits)
    : store(store), workDir(std::move(workDir)), limits(limits) {}

std::string RememberTool::getDescription() const {
    return "Store a fact, decision, or piece of context for future sessions. "
           "Use this to persist important information that should be available across sessions.";
}

nlohmann::json RememberTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"fact", {{"type", "string"}, {"description", "The fact, decision, or context to remember"}}},
            {"tags", tagsProperty("Optional tags to categorize this fact (e.g., 'architecture', 'decision', 'preference')")}
        }},
        {"required", nlohmann::json::array({"fact"})}
    };
}

nlohmann::json RememberTool::execute(const nlohmann::json& args) {
    RememberRequest req;
    try {
        req = ToolArgs::parseRemember(args, limits);
    } catch (const ToolInputError& e) {
        return ToolResult::error(e.what());
    }

    try {
        Fact stored = store.addFact(req.fact, req.tags, workDir);
        return ToolResult::text("Stored fact #" + std::to_string(stored.id) + ": " +
                                ToolResult::truncate(req.fact, 100));
    } catch (const StoreError& e) {
        Logger::getInstance().error(std::string("remember: ") + e.what());
        return ToolResult::error(std::string("failed to store fact: ") + e.what());
    }
}

// ========== recall ==========

RecallTool::RecallTool(IStore& store, std::string workDir)
    : store(store), workDir(std::move(workDir)) {}

std::string RecallTool::getDescription() const {
    return "Search and retrieve stored facts. Use this to find previously stored context, decisions, or information.";
}

nlohmann::json RecallTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}, {"description", "Search query to find relevant facts (uses full-text search)"}}},
            {"tags", tagsProperty("Filter by tags")},
            {"current_dir_only", {{"type", "boolean"}, {"description", "If true, only return facts from the current directory"}}},
            {"limit", {{"type", "integer"}, {"description", "Maximum number of facts to return (default: 20)"}}}
        }}
    };
}

nlohmann::json RecallTool::execute(const nlohmann::json& args) {
    RecallRequest req;
    try {
        req = ToolArgs::parseRecall(args);
    } catch (const ToolInputError& e) {
        return ToolResult::error(e.what());
    }

    std::vector<Fact> facts;
    try {
        facts = store.getFacts(req.query, req.tags, req.currentDirOnly ? workDir : "", req.limit);
    } catch (const StoreError& e) {
        Logger::getInstance().error(std::string("recall: ") + e.what());
        return ToolResult::error(std::string("failed to recall facts: ") + e.what());
    }

    if (facts.empty()) {
        return ToolResult::text("No facts found matching your query.");
    }

    std::ostringstream ss;
    ss << "Found " << facts.size() << " fact(s):\n\n";
    for (const auto& f : facts) {
        ss << "**#" << f.id << "** [" << TimeUtils::formatLocal(f.createdAt, "%Y-%m-%d %H:%M") << "]\n";
        if (!f.tags.empty()) {
            ss << "Tags: " << joinTags(f.tags) << "\n";
        }
        ss << "Dir: " << f.sourceDir << "\n";
        ss << f.content << "\n\n";
    }
    return ToolResult::text(ss.str());
}

// ========== get_context ==========

GetContextTool::GetContextTool(IStore& store, std::string workDir)
    : store(store), workDir(std::move(workDir)) {}

std::string GetContextTool::getDescription() const {
    return "Get all relevant context for the current working directory. "
           "Call this at the start of a session to load persistent context.";
}

nlohmann::json GetContextTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
}

nlohmann::json GetContextTool::execute(const nlohmann::json& /*args*/) {
    std::vector<Fact> localFacts;
    std::vector<Fact> globalFacts;
    try {
        localFacts = store.getFacts("", {}, workDir, LocalLimit);
    } catch (const StoreError& e) {
        return ToolResult::error(std::string("failed to get local context: ") + e.what());
    }
    try {
        globalFacts = store.getFacts("", {}, "", GlobalLimit);
    } catch (const StoreError& e) {
        return ToolResult::error(std::string("failed to get global context: ") + e.what());
    }

    std::unordered_set<int64_t> localIds;
    for (const auto& f : localFacts) {
        localIds.insert(f.id);
    }
    std::vector<const Fact*> otherFacts;
    for (const auto& f : globalFacts) {
        if (!localIds.count(f.id)) {
            otherFacts.push_back(&f);
        }
    }

    std::ostringstream ss;
    ss << "# Context for " << workDir << "\n\n";

    if (!localFacts.empty()) {
        ss << "## Local Facts (this directory)\n\n";
        for (const auto& f : localFacts) {
            ss << "- " << f.content;
            if (!f.tags.empty()) ss << " [" << joinTags(f.tags) << "]";
            ss << "\n";
        }
        ss << "\n";
    }

    if (!otherFacts.empty()) {
        ss << "## Recent Facts (other directories)\n\n";
        for (const Fact* f : otherFacts) {
            ss << "- " << f->content << " (" << f->sourceDir << ")";
            if (!f->tags.empty()) ss << " [" << joinTags(f->tags) << "]";
            ss << "\n";
        }
    }

    if (localFacts.empty() && otherFacts.empty()) {
        ss << "No stored context yet. Use the `remember` tool to store facts and decisions.\n";
    }

    return ToolResult::text(ss.str());
}
