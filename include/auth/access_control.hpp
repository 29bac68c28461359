#ifndef POSTSCHED_ACCESS_CONTROL_HPP
#define POSTSCHED_ACCESS_CONTROL_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "../storage/stores.hpp"

namespace postsched {

// Who may schedule posts. The first user to register becomes the superadmin;
// everyone after that waits in a capped pending queue until an approved user
// or the superadmin decides.
class AccessControl {
public:
    AccessControl(UserStore& store, int pending_cap, int default_tz_offset_minutes);

    // Creates the record on first contact. A rejected record yields
    // AlreadyRejected; an existing record reports its current state.
    Error registerUser(int64_t user_id, const std::string& username, UserState& out_state);

    Error approve(int64_t admin_id, int64_t target_id);
    Error reject(int64_t admin_id, int64_t target_id);
    Error remove(int64_t admin_id, int64_t target_id);

    Error listPending(std::vector<UserRecord>& out);
    Error listApproved(std::vector<UserRecord>& out);
    Error listUsers(std::vector<UserRecord>& out);

    // None for approved users and the superadmin, NotAuthorized for everyone
    // else (including unknown ids), StorageUnavailable when the store fails.
    Error authorize(int64_t user_id);
    bool isAuthorized(int64_t user_id);
    bool isSuperadmin(int64_t user_id);

    Error setTimezone(int64_t user_id, const std::string& offset_text);
    Error getUser(int64_t user_id, UserRecord& out);

private:
    // Checks the actor and loads the target for approve/reject/remove.
    Error checkAdminAction(int64_t admin_id, int64_t target_id, UserRecord& target);

    UserStore& store_;
    int pending_cap_;
    int default_tz_offset_minutes_;
};

} // namespace postsched

#endif // POSTSCHED_ACCESS_CONTROL_HPP
