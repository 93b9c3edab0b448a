/**
 * @file CommandQueue.hpp
 * @brief FIFO of deferred structural operations.
 *
 * Reactive code (component hooks, clone behaviours, observer callbacks)
 * may not change the world's structure while another structural change is
 * in progress.  It enqueues a Command instead; the World drains the queue
 * at its next flush point, in enqueue order, with full exclusive access.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_COMMANDQUEUE_HPP
    #define VGL_ECS_COMMANDQUEUE_HPP

#include <vgl/ecs/Entity.hpp>
#include <vgl/core/NonCopyable.hpp>
#include <vgl/core/Types.hpp>

#include <deque>
#include <functional>
#include <optional>

namespace vgl::ecs {

class World;

/** @brief A deferred operation, run later with exclusive world access. */
using Command = std::function<void(World&)>;

/**
 * @class CommandQueue
 * @brief Owning FIFO of pending commands.
 */
class CommandQueue final : public core::NonCopyable
{
public:
    CommandQueue() = default;

    void push(Command command);

    /** @brief Removes and returns the oldest command, if any. */
    [[nodiscard]] std::optional<Command> pop();

    [[nodiscard]] core::usize size()  const noexcept { return _commands.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _commands.empty(); }

private:
    std::deque<Command> _commands;
};

/**
 * @class Commands
 * @brief Non-owning enqueue handle over a CommandQueue.
 *
 * This is the only way reactive code may request a structural change.
 */
class Commands final
{
public:
    explicit Commands(CommandQueue& queue) noexcept : _queue{queue} {}

    /** @brief Enqueues an arbitrary deferred operation. */
    void push(Command command);

    /**
     * @brief Enqueues a despawn of @p entity.
     *
     * An entity that is already gone when the command runs is skipped.
     */
    void despawn(EntityId entity);

private:
    CommandQueue& _queue;
};

} // namespace vgl::ecs

#endif // VGL_ECS_COMMANDQUEUE_HPP
