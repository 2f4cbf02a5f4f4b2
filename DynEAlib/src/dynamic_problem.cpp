#include "dynamic_problem.hpp"

// ChangeTracker
void ChangeTracker::mark_changed()
{
    std::lock_guard<std::mutex> lock(flag_mtx);
    modified = true;
}

bool ChangeTracker::has_changed() const
{
    std::lock_guard<std::mutex> lock(flag_mtx);
    return modified;
}

bool ChangeTracker::consume_change()
{
    std::lock_guard<std::mutex> lock(flag_mtx);
    bool was_modified = modified;
    modified = false;
    return was_modified;
}
