#include "tools/BuiltinTools.h"
#include "tools/MemoryTools.h"
#include "tools/MessagingTools.h"
#include <memory>

void registerBuiltinTools(ToolRegistry& registry,
                          IStore& store,
                          InstanceManager& instances,
                          const SessionInfo& session,
                          const Limits& limits) {
    registry.registerTool(std::make_unique<RememberTool>(store, session.workDir, limits));
    registry.registerTool(std::make_unique<RecallTool>(store, session.workDir));
    registry.registerTool(std::make_unique<GetContextTool>(store, session.workDir));
    registry.registerTool(std::make_unique<ListInstancesTool>(instances, session.instanceId));
    registry.registerTool(std::make_unique<SendMessageTool>(store, instances, session.instanceId, limits));
    registry.registerTool(std::make_unique<GetMessagesTool>(store, session.instanceId));
}
