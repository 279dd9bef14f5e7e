#pragma once

#include "goalglide/data/LockedFile.hpp"
#include "goalglide/session/ActiveSession.hpp"

#include <optional>
#include <type_traits>

namespace goalglide {
namespace session {

// session.json: present while a timer is active, absent otherwise.
// Old files are read with defaults in memory and never rewritten on read.
class SessionStateFile
{
public:
    explicit SessionStateFile(QString filePath);

    const QString &filePath() const;

    std::optional<ActiveSessionState> load() const;

    // Read-modify-write under the lock. fn receives the current state
    // (empty when no session is active) and may replace or reset it; an
    // engaged state is written back, an empty one removes the file.
    template <typename Fn>
    decltype(auto) transition(Fn &&fn)
    {
        return m_file.withLock([&]() -> decltype(auto) {
            std::optional<ActiveSessionState> state = readUnlocked();
            if constexpr (std::is_void_v<std::invoke_result_t<Fn, std::optional<ActiveSessionState> &>>) {
                fn(state);
                storeUnlocked(state);
            } else {
                auto result = fn(state);
                storeUnlocked(state);
                return result;
            }
        });
    }

private:
    std::optional<ActiveSessionState> readUnlocked() const;
    void storeUnlocked(const std::optional<ActiveSessionState> &state) const;

    data::LockedFile m_file;
};

} // namespace session
} // namespace goalglide
