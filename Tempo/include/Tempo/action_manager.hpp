#pragma once

#include "action.hpp"
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Tempo {

// ============================================================
// ActionManager
// ============================================================

/**
 * Runs actions against their targets, one record per target.
 *
 * Records are kept in an arena and recycled through a free list. Targets are
 * visited in the order they were first registered and their actions in the
 * order they were added. Callbacks fired from inside update() may add or
 * remove actions on any target, including the one being stepped: a record
 * being iterated is locked and only deleted once its iteration finishes.
 *
 * Targets are not owned. Remove a target's actions before destroying it.
 *
 * Example:
 *     ActionManager manager;
 *     manager.addAction(moveBy(1.0f, {5, 0, 0}), node.get());
 *     manager.update(1.0f / 60.0f);
 */
class ActionManager {
public:
    ActionManager() = default;
    ~ActionManager() = default;

    ActionManager(const ActionManager&) = delete;
    ActionManager& operator=(const ActionManager&) = delete;

    // Binds `action` to `target` and queues it. Throws ArgumentError when either is null.
    void addAction(std::shared_ptr<Action> action, Target* target, bool paused = false);

    void removeAllActions();
    void removeAllActionsFromTarget(Target* target);
    void removeAction(const Action* action);
    void removeAction(const std::shared_ptr<Action>& action) { removeAction(action.get()); }
    void removeActionByTag(int tag, Target* target);

    std::shared_ptr<Action> getActionByTag(int tag, Target* target) const;
    std::size_t numberOfRunningActionsInTarget(Target* target) const;

    void pauseTarget(Target* target);
    void resumeTarget(Target* target);

    // Pauses every target that is currently running and returns them.
    std::vector<Target*> pauseAllRunningActions();
    void resumeTargets(const std::vector<Target*>& targets);

    void update(float dt);

    // Targets with at least one action.
    std::size_t getTargetCount() const { return m_order.size(); }

    // Records waiting in the free list.
    std::size_t getPooledRecordCount() const { return m_freeRecords.size(); }

private:
    struct Record {
        Target* target = nullptr;
        std::vector<std::shared_ptr<Action>> actions;
        std::ptrdiff_t actionIndex = 0;
        std::shared_ptr<Action> currentAction;
        bool paused = false;
        bool locked = false;

        void reset();
    };

    Record* findRecord(const Target* target);
    const Record* findRecord(const Target* target) const;
    std::size_t acquireRecord(Target* target, bool paused);
    void deleteRecord(std::size_t recordIndex);
    void removeActionAtIndex(std::size_t index, std::size_t recordIndex);
    void retireAction(const std::shared_ptr<Action>& action);

    std::vector<Record> m_records;
    std::vector<std::size_t> m_freeRecords;
    std::unordered_map<TargetId, std::size_t> m_recordByTarget;

    // Live record indices in registration order.
    std::vector<std::size_t> m_order;
    std::ptrdiff_t m_orderIndex = 0;
    bool m_updating = false;
};

} // namespace Tempo
