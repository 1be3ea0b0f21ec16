#include "Tempo/action_manager.hpp"
#include "Tempo/errors.hpp"
#include "Tempo/log.hpp"
#include <tracy/Tracy.hpp>
#include <algorithm>
#include <cassert>
#include <optional>

namespace Tempo {

void ActionManager::Record::reset() {
    target = nullptr;
    actions.clear();
    actionIndex = 0;
    currentAction.reset();
    paused = false;
    locked = false;
}

// ============================================================
// Registration
// ============================================================

void ActionManager::addAction(std::shared_ptr<Action> action, Target* target, bool paused) {
    if (!action) {
        throw ArgumentError("ActionManager::addAction(): action must be non-null");
    }
    if (!target) {
        throw ArgumentError("ActionManager::addAction(): target must be non-null");
    }

    std::size_t recordIndex;
    if (auto it = m_recordByTarget.find(target->getId()); it != m_recordByTarget.end()) {
        recordIndex = it->second;
    } else {
        recordIndex = acquireRecord(target, paused);
    }

    m_records[recordIndex].actions.push_back(action);
    action->startWithTarget(target);
}

void ActionManager::removeAllActions() {
    // Deleting records reorders m_order.
    std::vector<Target*> targets;
    targets.reserve(m_order.size());
    for (std::size_t recordIndex : m_order) {
        targets.push_back(m_records[recordIndex].target);
    }
    for (Target* target : targets) {
        removeAllActionsFromTarget(target);
    }
}

void ActionManager::removeAllActionsFromTarget(Target* target) {
    if (!target) {
        return;
    }
    auto it = m_recordByTarget.find(target->getId());
    if (it == m_recordByTarget.end()) {
        return;
    }

    std::size_t recordIndex = it->second;
    Record& record = m_records[recordIndex];

    auto actions = std::move(record.actions);
    record.actions.clear();
    record.actionIndex = -1;

    for (const auto& action : actions) {
        if (action->getTarget()) {
            action->stop();
        }
    }

    deleteRecord(recordIndex);
}

void ActionManager::removeAction(const Action* action) {
    if (!action) {
        return;
    }
    Target* target = action->getOriginalTarget();
    if (!target) {
        return;
    }
    auto it = m_recordByTarget.find(target->getId());
    if (it == m_recordByTarget.end()) {
        return;
    }

    std::size_t recordIndex = it->second;
    const auto& actions = m_records[recordIndex].actions;
    for (std::size_t i = 0; i < actions.size(); i++) {
        if (actions[i].get() == action) {
            removeActionAtIndex(i, recordIndex);
            return;
        }
    }
}

void ActionManager::removeActionByTag(int tag, Target* target) {
    if (tag == Action::kTagInvalid) {
        log::warn("ActionManager::removeActionByTag(): invalid tag");
        return;
    }
    if (!target) {
        return;
    }
    auto it = m_recordByTarget.find(target->getId());
    if (it == m_recordByTarget.end()) {
        return;
    }

    std::size_t recordIndex = it->second;
    const auto& actions = m_records[recordIndex].actions;
    for (std::size_t i = 0; i < actions.size(); i++) {
        if (actions[i]->getTag() == tag && actions[i]->getOriginalTarget() == target) {
            removeActionAtIndex(i, recordIndex);
            return;
        }
    }
}

// ============================================================
// Queries
// ============================================================

std::shared_ptr<Action> ActionManager::getActionByTag(int tag, Target* target) const {
    if (tag == Action::kTagInvalid) {
        log::warn("ActionManager::getActionByTag(): invalid tag");
        return nullptr;
    }
    const Record* record = findRecord(target);
    if (!record) {
        return nullptr;
    }
    for (const auto& action : record->actions) {
        if (action && action->getTag() == tag) {
            return action;
        }
    }
    return nullptr;
}

std::size_t ActionManager::numberOfRunningActionsInTarget(Target* target) const {
    const Record* record = findRecord(target);
    return record ? record->actions.size() : 0;
}

// ============================================================
// Pause / Resume
// ============================================================

void ActionManager::pauseTarget(Target* target) {
    if (Record* record = findRecord(target)) {
        record->paused = true;
    }
}

void ActionManager::resumeTarget(Target* target) {
    if (Record* record = findRecord(target)) {
        record->paused = false;
    }
}

std::vector<Target*> ActionManager::pauseAllRunningActions() {
    std::vector<Target*> paused;
    for (std::size_t recordIndex : m_order) {
        Record& record = m_records[recordIndex];
        if (!record.paused) {
            record.paused = true;
            paused.push_back(record.target);
        }
    }
    return paused;
}

void ActionManager::resumeTargets(const std::vector<Target*>& targets) {
    for (Target* target : targets) {
        resumeTarget(target);
    }
}

// ============================================================
// Update
// ============================================================

void ActionManager::update(float dt) {
    ZoneScoped;

    if (m_updating) {
        log::warn("ActionManager::update(): called re-entrantly, ignoring");
        return;
    }

    // Ends the pass on every exit, including an exception escaping a step.
    struct UpdateScope {
        ActionManager& manager;
        std::optional<std::size_t> lockedRecord;

        ~UpdateScope() {
            if (lockedRecord) {
                manager.m_records[*lockedRecord].locked = false;
                manager.deleteRecord(*lockedRecord);
            }
            manager.m_updating = false;
            manager.m_orderIndex = 0;
        }
    };

    m_updating = true;
    UpdateScope scope{ *this, std::nullopt };

    for (m_orderIndex = 0; m_orderIndex < static_cast<std::ptrdiff_t>(m_order.size()); ++m_orderIndex) {
        // Records are addressed by index; the arena may grow while actions run.
        const std::size_t recordIndex = m_order[m_orderIndex];

        if (!m_records[recordIndex].paused) {
            m_records[recordIndex].locked = true;
            scope.lockedRecord = recordIndex;

            for (m_records[recordIndex].actionIndex = 0;
                 m_records[recordIndex].actionIndex < static_cast<std::ptrdiff_t>(m_records[recordIndex].actions.size());
                 ++m_records[recordIndex].actionIndex) {
                Record& record = m_records[recordIndex];
                auto action = record.actions[record.actionIndex];
                record.currentAction = action;

                bool failed = false;
                try {
                    action->step(dt * action->getSpeed());
                } catch (const std::exception& e) {
                    log::error("ActionManager::update(): action step failed: {}", e.what());
                    failed = true;
                } catch (...) {
                    log::error("ActionManager::update(): action step threw a non-standard exception");
                    m_records[recordIndex].currentAction.reset();
                    retireAction(action);
                    throw;
                }

                if (failed || action->isDone()) {
                    retireAction(action);
                }

                m_records[recordIndex].currentAction.reset();
            }

            m_records[recordIndex].locked = false;
            scope.lockedRecord.reset();
        }

        if (m_records[recordIndex].actions.empty()) {
            deleteRecord(recordIndex);
        }
    }
}

void ActionManager::retireAction(const std::shared_ptr<Action>& action) {
    // Already stopped if its own callback cleared the target.
    if (action->getTarget()) {
        action->stop();
    }
    removeAction(action.get());
}

// ============================================================
// Records
// ============================================================

ActionManager::Record* ActionManager::findRecord(const Target* target) {
    if (!target) {
        return nullptr;
    }
    auto it = m_recordByTarget.find(target->getId());
    return it != m_recordByTarget.end() ? &m_records[it->second] : nullptr;
}

const ActionManager::Record* ActionManager::findRecord(const Target* target) const {
    if (!target) {
        return nullptr;
    }
    auto it = m_recordByTarget.find(target->getId());
    return it != m_recordByTarget.end() ? &m_records[it->second] : nullptr;
}

std::size_t ActionManager::acquireRecord(Target* target, bool paused) {
    std::size_t recordIndex;
    if (!m_freeRecords.empty()) {
        recordIndex = m_freeRecords.back();
        m_freeRecords.pop_back();
    } else {
        recordIndex = m_records.size();
        m_records.emplace_back();
    }

    Record& record = m_records[recordIndex];
    record.target = target;
    record.paused = paused;

    m_recordByTarget.emplace(target->getId(), recordIndex);
    m_order.push_back(recordIndex);
    return recordIndex;
}

void ActionManager::deleteRecord(std::size_t recordIndex) {
    Record& record = m_records[recordIndex];
    if (record.locked || !record.actions.empty()) {
        return;
    }

    auto pos = std::find(m_order.begin(), m_order.end(), recordIndex);
    assert(pos != m_order.end() && "live record missing from registration order");
    auto orderPos = std::distance(m_order.begin(), pos);
    m_order.erase(pos);
    if (m_updating && orderPos <= m_orderIndex) {
        --m_orderIndex;
    }

    m_recordByTarget.erase(record.target->getId());
    record.reset();
    m_freeRecords.push_back(recordIndex);
}

void ActionManager::removeActionAtIndex(std::size_t index, std::size_t recordIndex) {
    Record& record = m_records[recordIndex];
    record.actions.erase(record.actions.begin() + static_cast<std::ptrdiff_t>(index));

    // Keep the in-progress iteration pointing at the same next action.
    if (record.actionIndex >= static_cast<std::ptrdiff_t>(index)) {
        record.actionIndex--;
    }

    if (record.actions.empty()) {
        deleteRecord(recordIndex);
    }
}

} // namespace Tempo
