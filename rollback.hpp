#pragma once

#include <functional>
#include <string>
#include <vector>

// Undo actions registered while installing. Unless commit() is called, the
// actions run newest first when rollback() is called or the stack goes out
// of scope.
class RollbackStack {
public:
    RollbackStack() = default;
    ~RollbackStack();

    RollbackStack(const RollbackStack &) = delete;
    RollbackStack &operator=(const RollbackStack &) = delete;

    void push(const std::string &description, std::function<bool()> undo);
    void commit();
    // Returns false if any undo action failed.
    bool rollback();

    size_t size() const { return mActions.size(); }

private:
    typedef struct {
        std::string description;
        std::function<bool()> undo;
    } action_t;

    std::vector<action_t> mActions;
};
