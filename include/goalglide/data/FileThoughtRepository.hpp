#pragma once

#include "goalglide/data/JsonDocumentStore.hpp"
#include "goalglide/data/ThoughtRepository.hpp"

#include <memory>

namespace goalglide {
namespace data {

class FileThoughtRepository : public ThoughtRepository
{
public:
    static const QString kTableName;

    explicit FileThoughtRepository(std::shared_ptr<JsonDocumentStore> store);
    ~FileThoughtRepository() override = default;

    void addThought(const Thought &thought) override;
    std::vector<Thought> fetchThoughts(const ThoughtQuery &query = {}) const override;
    bool removeThought(const QString &id) override;

private:
    std::shared_ptr<JsonDocumentStore> m_store;
};

} // namespace data
} // namespace goalglide
