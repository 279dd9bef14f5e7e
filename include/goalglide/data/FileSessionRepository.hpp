#pragma once

#include "goalglide/data/JsonDocumentStore.hpp"
#include "goalglide/data/SessionRepository.hpp"

#include <memory>

namespace goalglide {
namespace data {

class FileSessionRepository : public SessionRepository
{
public:
    static const QString kTableName;

    explicit FileSessionRepository(std::shared_ptr<JsonDocumentStore> store);
    ~FileSessionRepository() override = default;

    void addSession(const PomodoroSession &session) override;
    std::vector<PomodoroSession> fetchSessions() const override;

private:
    std::shared_ptr<JsonDocumentStore> m_store;
};

} // namespace data
} // namespace goalglide
