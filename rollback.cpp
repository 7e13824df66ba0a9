#include "rollback.hpp"

#include <utility>

#include "log.hpp"

RollbackStack::~RollbackStack() {
    if (!mActions.empty()) {
        (void)rollback();
    }
}

void
RollbackStack::push(const std::string &description, std::function<bool()> undo) {
    mActions.push_back({ .description = description, .undo = std::move(undo) });
}

void
RollbackStack::commit() {
    mActions.clear();
}

bool
RollbackStack::rollback() {
    if (mActions.empty()) {
        return true;
    }

    LOG_WARNING("Rolling back %zu change(s)...", mActions.size());
    bool ok = true;
    while (!mActions.empty()) {
        auto action = std::move(mActions.back());
        mActions.pop_back();
        LOG_INFO("Undo: %s", action.description.c_str());
        if (!action.undo()) {
            LOG_ERROR("Undo failed: %s", action.description.c_str());
            ok = false;
        }
    }
    LOG_INFO("Rollback completed.");
    return ok;
}
