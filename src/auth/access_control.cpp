#include "../../include/auth/access_control.hpp"
#include "../../include/scheduler/timezone.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

AccessControl::AccessControl(UserStore& store, int pending_cap, int default_tz_offset_minutes)
    : store_(store),
      pending_cap_(pending_cap),
      default_tz_offset_minutes_(default_tz_offset_minutes) {
}

Error AccessControl::registerUser(int64_t user_id, const std::string& username, UserState& out_state) {
    UserRecord existing;
    Error err = store_.findUser(user_id, existing);
    if (err == Error::None) {
        if (existing.state == UserState::Rejected) return Error::AlreadyRejected;
        out_state = existing.state;
        return Error::None;
    }
    if (err != Error::NotFound) return err;

    UserRecord user;
    user.user_id = user_id;
    user.username = username;
    user.tz_offset_minutes = default_tz_offset_minutes_;
    user.created_at = nowUtc();

    err = store_.insertSuperadmin(user);
    if (err == Error::None) {
        Logger::getInstance().info("User " + std::to_string(user_id) + " registered as superadmin");
        out_state = UserState::Superadmin;
        return Error::None;
    }
    if (err != Error::StateConflict) return err;

    err = store_.insertPending(user, pending_cap_);
    if (err == Error::None) {
        Logger::getInstance().info("User " + std::to_string(user_id) + " registered, pending approval");
        out_state = UserState::Pending;
        return Error::None;
    }
    if (err == Error::QueueFull) {
        Logger::getInstance().warning("Registration of " + std::to_string(user_id) +
                                      " refused: pending queue is full");
        return err;
    }
    if (err != Error::StateConflict) return err;

    // Lost a race with a concurrent registration of the same id.
    err = store_.findUser(user_id, existing);
    if (err != Error::None) return err;
    if (existing.state == UserState::Rejected) return Error::AlreadyRejected;
    out_state = existing.state;
    return Error::None;
}

Error AccessControl::checkAdminAction(int64_t admin_id, int64_t target_id, UserRecord& target) {
    Error err = authorize(admin_id);
    if (err != Error::None) return err;

    err = store_.findUser(target_id, target);
    if (err != Error::None) return err;
    if (target.state == UserState::Superadmin) return Error::InvalidState;
    return Error::None;
}

Error AccessControl::approve(int64_t admin_id, int64_t target_id) {
    UserRecord target;
    Error err = checkAdminAction(admin_id, target_id, target);
    if (err != Error::None) return err;
    if (target.state == UserState::Approved) return Error::None;

    err = store_.updateUserState(target_id, UserState::Approved);
    if (err == Error::None) {
        Logger::getInstance().info("User " + std::to_string(target_id) + " approved by " +
                                   std::to_string(admin_id));
    }
    return err;
}

Error AccessControl::reject(int64_t admin_id, int64_t target_id) {
    UserRecord target;
    Error err = checkAdminAction(admin_id, target_id, target);
    if (err != Error::None) return err;
    if (target.state == UserState::Rejected) return Error::None;

    err = store_.updateUserState(target_id, UserState::Rejected);
    if (err == Error::None) {
        Logger::getInstance().info("User " + std::to_string(target_id) + " rejected by " +
                                   std::to_string(admin_id));
    }
    return err;
}

Error AccessControl::remove(int64_t admin_id, int64_t target_id) {
    UserRecord target;
    Error err = checkAdminAction(admin_id, target_id, target);
    if (err != Error::None) return err;

    err = store_.deleteUser(target_id);
    if (err == Error::None) {
        Logger::getInstance().info("User " + std::to_string(target_id) + " removed by " +
                                   std::to_string(admin_id));
    }
    return err;
}

Error AccessControl::listPending(std::vector<UserRecord>& out) {
    return store_.listUsersByState(UserState::Pending, out);
}

Error AccessControl::listApproved(std::vector<UserRecord>& out) {
    return store_.listUsersByState(UserState::Approved, out);
}

Error AccessControl::listUsers(std::vector<UserRecord>& out) {
    return store_.listUsers(out);
}

Error AccessControl::authorize(int64_t user_id) {
    UserRecord user;
    const Error err = store_.findUser(user_id, user);
    if (err == Error::NotFound) return Error::NotAuthorized;
    if (err != Error::None) return err;
    if (user.state == UserState::Approved || user.state == UserState::Superadmin) return Error::None;
    return Error::NotAuthorized;
}

bool AccessControl::isAuthorized(int64_t user_id) {
    return authorize(user_id) == Error::None;
}

bool AccessControl::isSuperadmin(int64_t user_id) {
    UserRecord user;
    return store_.findUser(user_id, user) == Error::None && user.state == UserState::Superadmin;
}

Error AccessControl::setTimezone(int64_t user_id, const std::string& offset_text) {
    int offset = 0;
    Error err = parseOffset(offset_text, offset);
    if (err != Error::None) return err;

    err = store_.updateUserTimezone(user_id, offset);
    if (err == Error::None) {
        Logger::getInstance().info("User " + std::to_string(user_id) + " timezone set to " + formatOffset(offset));
    }
    return err;
}

Error AccessControl::getUser(int64_t user_id, UserRecord& out) {
    return store_.findUser(user_id, out);
}

} // namespace postsched
