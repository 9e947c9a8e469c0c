#include "nostrfs/server/errors.hpp"

namespace nostrfs {
namespace server {

// 返回给客户端的纯文本消息，不区分认证失败的具体原因
const Error Error::ErrUnauthorized(1, "Unauthorized: authorization header must carry a valid signed Nostr event");
const Error Error::ErrWrongPubkey(2, "Forbidden: wrong pubkey");
const Error Error::ErrInvalidTargetDir(3, "Forbidden: target directory structure is invalid");
const Error Error::ErrFileNotFound(4, "File not found");
const Error Error::ErrCreatingDirectory(5, "Error creating directory");
const Error Error::ErrWritingFile(6, "Error writing file");
const Error Error::ErrNoStorage(7, "Storage service unavailable");
const Error Error::ErrUnknown(8, "Internal server error");

} // namespace server
} // namespace nostrfs
