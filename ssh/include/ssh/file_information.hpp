#pragma once

#include <shared_data/directory_entry.hpp>

#include <libssh/sftp.h>

#include <cstdint>

namespace SecureShell
{
    using FileInformation = SharedData::DirectoryEntry;

    SharedData::FileType fileTypeFromSftp(std::uint8_t sftpType);
    FileInformation fromSftpAttributes(sftp_attributes attributes);
}
