// POLITY - Operation Status
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Status is the caller-visible outcome of every fallible registry,
// transition, authorization and membership operation. Results are handed
// back through out-parameters; a non-ok Status never carries a result.

#ifndef POLITY_CORE_STATUS_H
#define POLITY_CORE_STATUS_H

#include <string>

namespace polity {

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        INVALID_PARENT,
        INVALID_STATE,
        TRANSITION_IN_PROGRESS,
        REJECTED,
        DEPTH_EXCEEDED,
        DUPLICATE_ID,
        INVALID_ARGUMENT,
        STORAGE_ERROR,

        // Membership
        INVALID_INVITE,
        INVITE_ALREADY_USED,
        INVITE_EXPIRED,
        INVALID_INPUT,
        INVALID_DEMOGRAPHIC,
        ALREADY_MEMBER,
        INDEX_FULL,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status InvalidParent(const std::string& msg = "") { return Status(INVALID_PARENT, msg); }
    static Status InvalidState(const std::string& msg = "") { return Status(INVALID_STATE, msg); }
    static Status TransitionInProgress(const std::string& msg = "") {
        return Status(TRANSITION_IN_PROGRESS, msg);
    }
    static Status Rejected(const std::string& msg = "") { return Status(REJECTED, msg); }
    static Status DepthExceeded(const std::string& msg = "") { return Status(DEPTH_EXCEEDED, msg); }
    static Status DuplicateId(const std::string& msg = "") { return Status(DUPLICATE_ID, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(STORAGE_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsInvalidParent() const { return code_ == INVALID_PARENT; }
    bool IsInvalidState() const { return code_ == INVALID_STATE; }
    bool IsTransitionInProgress() const { return code_ == TRANSITION_IN_PROGRESS; }
    bool IsRejected() const { return code_ == REJECTED; }
    bool IsDepthExceeded() const { return code_ == DEPTH_EXCEEDED; }
    bool IsDuplicateId() const { return code_ == DUPLICATE_ID; }
    bool IsInvalidArgument() const { return code_ == INVALID_ARGUMENT; }
    bool IsStorageError() const { return code_ == STORAGE_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result = CodeName(code_);
        if (!message_.empty()) {
            result += ": " + message_;
        }
        return result;
    }

    static const char* CodeName(Code code) {
        switch (code) {
            case OK: return "OK";
            case NOT_FOUND: return "NotFound";
            case INVALID_PARENT: return "InvalidParent";
            case INVALID_STATE: return "InvalidState";
            case TRANSITION_IN_PROGRESS: return "TransitionInProgress";
            case REJECTED: return "Rejected";
            case DEPTH_EXCEEDED: return "DepthExceeded";
            case DUPLICATE_ID: return "DuplicateId";
            case INVALID_ARGUMENT: return "InvalidArgument";
            case STORAGE_ERROR: return "StorageError";
            case INVALID_INVITE: return "InvalidInvite";
            case INVITE_ALREADY_USED: return "InviteAlreadyUsed";
            case INVITE_EXPIRED: return "InviteExpired";
            case INVALID_INPUT: return "InvalidInput";
            case INVALID_DEMOGRAPHIC: return "InvalidDemographic";
            case ALREADY_MEMBER: return "AlreadyMember";
            case INDEX_FULL: return "IndexFull";
            default: return "Unknown";
        }
    }

private:
    Code code_;
    std::string message_;
};

} // namespace polity

#endif // POLITY_CORE_STATUS_H
