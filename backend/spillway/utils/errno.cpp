#include "errno.hpp"

#include <cerrno>

const char* errnoStr() {
    switch (errno) {
        case EACCES:
            return "EACCES";
        case EAGAIN:
            return "EAGAIN/EWOULDBLOCK";
        case EBADF:
            return "EBADF";
        case EDQUOT:
            return "EDQUOT";
        case EEXIST:
            return "EEXIST";
        case EFAULT:
            return "EFAULT";
        case EFBIG:
            return "EFBIG";
        case EINTR:
            return "EINTR";
        case EINVAL:
            return "EINVAL";
        case EIO:
            return "EIO";
        case EISDIR:
            return "EISDIR";
        case EMFILE:
            return "EMFILE";
        case ENAMETOOLONG:
            return "ENAMETOOLONG";
        case ENFILE:
            return "ENFILE";
        case ENOENT:
            return "ENOENT";
        case ENOSPC:
            return "ENOSPC";
        case ENOTDIR:
            return "ENOTDIR";
        case ENOTEMPTY:
            return "ENOTEMPTY";
        case EPERM:
            return "EPERM";
        case EROFS:
            return "EROFS";
        default:
            return "unknown errno";
    }
}
