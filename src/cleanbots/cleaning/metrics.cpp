#include "metrics.hpp"

double percent_clean(const Model& model)
{
    return model.percent_clean();
}

std::int64_t total_moves(const Model& model)
{
    return model.total_moves();
}

AgentKind agent_kind(const Agent& agent)
{
    return agent.kind();
}

std::pair<int, int> agent_position(const Agent& agent)
{
    return {agent.cell().x, agent.cell().y};
}
