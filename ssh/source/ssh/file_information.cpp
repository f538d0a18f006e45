#include <ssh/file_information.hpp>

namespace SecureShell
{
    SharedData::FileType fileTypeFromSftp(std::uint8_t sftpType)
    {
        switch (sftpType)
        {
            case SSH_FILEXFER_TYPE_REGULAR:
                return SharedData::FileType::Regular;
            case SSH_FILEXFER_TYPE_DIRECTORY:
                return SharedData::FileType::Directory;
            case SSH_FILEXFER_TYPE_SYMLINK:
                return SharedData::FileType::Symlink;
            case SSH_FILEXFER_TYPE_SPECIAL:
                return SharedData::FileType::Special;
            default:
                return SharedData::FileType::Unknown;
        }
    }

    FileInformation fromSftpAttributes(sftp_attributes attributes)
    {
        FileInformation info{
            .path = attributes->name ? std::string{attributes->name} : std::string{},
            .type = fileTypeFromSftp(attributes->type),
            .size = attributes->size,
            .permissions = static_cast<std::filesystem::perms>(attributes->permissions) & std::filesystem::perms::mask,
        };
        if (attributes->flags & SSH_FILEXFER_ATTR_ACMODTIME)
            info.mtime = attributes->mtime;
        return info;
    }
}
