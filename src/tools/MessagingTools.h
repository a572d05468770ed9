#pragma once
#include "ITool.h"
#include "ToolArgs.h"
#include "instance/InstanceManager.h"
#include "store/Store.h"

/**
 * @brief List live daemon instances (stale ones are reclaimed first)
 */
class ListInstancesTool : public ITool {
public:
    ListInstancesTool(InstanceManager& instances, std::string selfId);

    std::string getName() const override { return "list_instances"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    InstanceManager& instances;
    std::string selfId;
};

/**
 * @brief Send a message to another registered instance
 *
 * The recipient must exist; otherwise nothing is stored.
 */
class SendMessageTool : public ITool {
public:
    SendMessageTool(IStore& store, InstanceManager& instances, std::string selfId, Limits limits);

    std::string getName() const override { return "send_message"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    IStore& store;
    InstanceManager& instances;
    std::string selfId;
    Limits limits;
};

/**
 * @brief Read this instance's mailbox
 *
 * Every unread message returned is marked read, so a message is only ever
 * reported as unread once.
 */
class GetMessagesTool : public ITool {
public:
    GetMessagesTool(IStore& store, std::string selfId);

    std::string getName() const override { return "get_messages"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    IStore& store;
    std::string selfId;
};
