#pragma once
#include <string>
#include "ToolRegistry.h"
#include "ToolArgs.h"
#include "instance/InstanceManager.h"
#include "store/Store.h"

/**
 * @brief Who is calling: the daemon's own instance id and working directory
 */
struct SessionInfo {
    std::string instanceId;
    std::string workDir;
};

/**
 * @brief Register remember, recall, get_context, list_instances,
 *        send_message and get_messages, in that catalog order
 */
void registerBuiltinTools(ToolRegistry& registry,
                          IStore& store,
                          InstanceManager& instances,
                          const SessionInfo& session,
                          const Limits& limits);
