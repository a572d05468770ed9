#pragma once
#include "ITool.h"
#include "ToolArgs.h"
#include "store/Store.h"

/**
 * @brief Store a fact scoped to the caller's working directory
 */
class RememberTool : public ITool {
public:
    RememberTool(IStore& store, std::string workDir, Limits limits);

    std::string getName() const override { return "remember"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    IStore& store;
    std::string workDir;
    Limits limits;
};

/**
 * @brief Full-text / tag / directory search over stored facts
 */
class RecallTool : public ITool {
public:
    RecallTool(IStore& store, std::string workDir);

    std::string getName() const override { return "recall"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    IStore& store;
    std::string workDir;
};

/**
 * @brief Session-start context: local facts plus recent facts from elsewhere
 *
 * A fact already shown in the local section is never repeated in the
 * global one.
 */
class GetContextTool : public ITool {
public:
    static constexpr int LocalLimit = 50;
    static constexpr int GlobalLimit = 20;

    GetContextTool(IStore& store, std::string workDir);

    std::string getName() const override { return "get_context"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    IStore& store;
    std::string workDir;
};
