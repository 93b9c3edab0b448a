/**
 * @file CommandQueue.cpp
 * @brief Deferred command FIFO and its enqueue handle.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/CommandQueue.hpp>
#include <vgl/ecs/World.hpp>
#include <vgl/core/Log.hpp>

#include <string>
#include <utility>

namespace vgl::ecs {

void CommandQueue::push(Command command)
{
    _commands.push_back(std::move(command));
}

std::optional<Command> CommandQueue::pop()
{
    if (_commands.empty())
    {
        return std::nullopt;
    }
    std::optional<Command> front{std::move(_commands.front())};
    _commands.pop_front();
    return front;
}

void Commands::push(Command command)
{
    _queue.push(std::move(command));
}

void Commands::despawn(EntityId entity)
{
    _queue.push([entity](World& world) {
        if (!world.isAlive(entity))
        {
            core::Log::debug(core::LogTag::kEcs, "deferred despawn skipped: entity already gone");
            return;
        }

        auto result = world.despawn(entity);
        if (!result.has_value())
        {
            core::Log::warn(core::LogTag::kEcs, "deferred despawn failed: " + result.error().message());
        }
    });
}

} // namespace vgl::ecs
