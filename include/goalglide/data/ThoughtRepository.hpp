#pragma once

#include <optional>
#include <vector>

#include "goalglide/data/Thought.hpp"

namespace goalglide {
namespace data {

struct ThoughtQuery
{
    std::optional<QString> goalId;
    // Applied after sorting.
    std::optional<int> limit;
    bool newestFirst = true;
};

class ThoughtRepository
{
public:
    virtual ~ThoughtRepository() = default;

    virtual void addThought(const Thought &thought) = 0;
    virtual std::vector<Thought> fetchThoughts(const ThoughtQuery &query = {}) const = 0;
    // Returns false when no thought has this id.
    virtual bool removeThought(const QString &id) = 0;
};

} // namespace data
} // namespace goalglide
