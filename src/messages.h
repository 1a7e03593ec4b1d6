#pragma once

#include "file_split.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace remotefm {

/**
 * Kind of a remote filesystem path
 */
enum class FileType {
    DRIVE,
    DIRECTORY,
    FILE,
    BACK        // The ".." entry of a listing
};

enum class ProcessAction {
    START,
    END
};

const char* file_type_to_string(FileType type);
bool file_type_from_string(const std::string& text, FileType& type);
const char* process_action_to_string(ProcessAction action);
bool process_action_from_string(const std::string& text, ProcessAction& action);

/**
 * Remote storage volume as reported by the peer
 */
struct Drive {
    std::string display_name;
    std::string root_directory;
};

/**
 * One entry of a remote directory listing
 */
struct FileSystemEntry {
    std::string name;
    FileType entry_type;
    uint64_t size;
    std::optional<int64_t> last_access_time_utc;    // Seconds since epoch
    std::optional<std::string> content_type;

    FileSystemEntry() : entry_type(FileType::FILE), size(0) {}
};

// Message type names carried next to each payload
namespace message_types {
constexpr const char* FILE_TRANSFER_REQUEST = "file_transfer_request";
constexpr const char* FILE_TRANSFER_CHUNK = "file_transfer_chunk";
constexpr const char* FILE_TRANSFER_CANCEL = "file_transfer_cancel";
constexpr const char* FILE_TRANSFER_COMPLETE = "file_transfer_complete";
constexpr const char* GET_DRIVES = "get_drives";
constexpr const char* GET_DRIVES_RESPONSE = "get_drives_response";
constexpr const char* GET_DIRECTORY = "get_directory";
constexpr const char* GET_DIRECTORY_RESPONSE = "get_directory_response";
constexpr const char* DO_PATH_RENAME = "do_path_rename";
constexpr const char* DO_PATH_DELETE = "do_path_delete";
constexpr const char* SET_STATUS_FILE_MANAGER = "set_status_file_manager";
constexpr const char* DO_PROCESS_START = "do_process_start";
constexpr const char* DO_PROCESS_RESPONSE = "do_process_response";
} // namespace message_types

//=============================================================================
// Outbound messages
//=============================================================================

struct FileTransferRequest {
    static constexpr const char* TYPE = message_types::FILE_TRANSFER_REQUEST;
    int id = 0;
    std::string remote_path;
};

/**
 * A chunk of a transfer. Sent for uploads, received for downloads.
 * file_path is the remote destination on upload and unused on download.
 */
struct FileTransferChunkMessage {
    static constexpr const char* TYPE = message_types::FILE_TRANSFER_CHUNK;
    int id = 0;
    FileChunk chunk;
    std::string file_path;
    uint64_t file_size = 0;
};

/**
 * Cancel request when sent, cancel notification with a reason when received
 */
struct FileTransferCancel {
    static constexpr const char* TYPE = message_types::FILE_TRANSFER_CANCEL;
    int id = 0;
    std::string reason;
};

struct GetDrives {
    static constexpr const char* TYPE = message_types::GET_DRIVES;
};

struct GetDirectory {
    static constexpr const char* TYPE = message_types::GET_DIRECTORY;
    std::string remote_path;
};

struct DoPathRename {
    static constexpr const char* TYPE = message_types::DO_PATH_RENAME;
    std::string path;
    std::string new_path;
    FileType path_type = FileType::FILE;
};

struct DoPathDelete {
    static constexpr const char* TYPE = message_types::DO_PATH_DELETE;
    std::string path;
    FileType path_type = FileType::FILE;
};

struct DoProcessStart {
    static constexpr const char* TYPE = message_types::DO_PROCESS_START;
    std::string file_path;
};

//=============================================================================
// Inbound messages
//=============================================================================

struct FileTransferComplete {
    static constexpr const char* TYPE = message_types::FILE_TRANSFER_COMPLETE;
    int id = 0;
    std::string file_path;
};

struct GetDrivesResponse {
    static constexpr const char* TYPE = message_types::GET_DRIVES_RESPONSE;
    std::vector<Drive> drives;
};

struct GetDirectoryResponse {
    static constexpr const char* TYPE = message_types::GET_DIRECTORY_RESPONSE;
    std::string remote_path;
    std::vector<FileSystemEntry> items;     // Empty when the peer sent none
};

struct SetStatusFileManager {
    static constexpr const char* TYPE = message_types::SET_STATUS_FILE_MANAGER;
    std::string message;
};

struct DoProcessResponse {
    static constexpr const char* TYPE = message_types::DO_PROCESS_RESPONSE;
    ProcessAction action = ProcessAction::START;
    bool result = false;
};

// JSON conversion. from_json throws (nlohmann::json::exception or
// std::invalid_argument) on malformed payloads; callers decide how to report it.
void to_json(nlohmann::json& j, const FileChunk& chunk);
void from_json(const nlohmann::json& j, FileChunk& chunk);
void to_json(nlohmann::json& j, const Drive& drive);
void from_json(const nlohmann::json& j, Drive& drive);
void to_json(nlohmann::json& j, const FileSystemEntry& entry);
void from_json(const nlohmann::json& j, FileSystemEntry& entry);

void to_json(nlohmann::json& j, const FileTransferRequest& message);
void from_json(const nlohmann::json& j, FileTransferRequest& message);
void to_json(nlohmann::json& j, const FileTransferChunkMessage& message);
void from_json(const nlohmann::json& j, FileTransferChunkMessage& message);
void to_json(nlohmann::json& j, const FileTransferCancel& message);
void from_json(const nlohmann::json& j, FileTransferCancel& message);
void to_json(nlohmann::json& j, const FileTransferComplete& message);
void from_json(const nlohmann::json& j, FileTransferComplete& message);
void to_json(nlohmann::json& j, const GetDrives& message);
void to_json(nlohmann::json& j, const GetDrivesResponse& message);
void from_json(const nlohmann::json& j, GetDrivesResponse& message);
void to_json(nlohmann::json& j, const GetDirectory& message);
void from_json(const nlohmann::json& j, GetDirectory& message);
void to_json(nlohmann::json& j, const GetDirectoryResponse& message);
void from_json(const nlohmann::json& j, GetDirectoryResponse& message);
void to_json(nlohmann::json& j, const DoPathRename& message);
void from_json(const nlohmann::json& j, DoPathRename& message);
void to_json(nlohmann::json& j, const DoPathDelete& message);
void from_json(const nlohmann::json& j, DoPathDelete& message);
void to_json(nlohmann::json& j, const SetStatusFileManager& message);
void from_json(const nlohmann::json& j, SetStatusFileManager& message);
void to_json(nlohmann::json& j, const DoProcessStart& message);
void from_json(const nlohmann::json& j, DoProcessStart& message);
void to_json(nlohmann::json& j, const DoProcessResponse& message);
void from_json(const nlohmann::json& j, DoProcessResponse& message);

} // namespace remotefm
