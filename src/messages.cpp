#include "messages.h"
#include <stdexcept>

namespace remotefm {

const char* file_type_to_string(FileType type) {
    switch (type) {
        case FileType::DRIVE: return "drive";
        case FileType::DIRECTORY: return "directory";
        case FileType::FILE: return "file";
        case FileType::BACK: return "back";
        default: return "unknown";
    }
}

bool file_type_from_string(const std::string& text, FileType& type) {
    if (text == "drive") {
        type = FileType::DRIVE;
    } else if (text == "directory") {
        type = FileType::DIRECTORY;
    } else if (text == "file") {
        type = FileType::FILE;
    } else if (text == "back") {
        type = FileType::BACK;
    } else {
        return false;
    }
    return true;
}

const char* process_action_to_string(ProcessAction action) {
    switch (action) {
        case ProcessAction::START: return "start";
        case ProcessAction::END: return "end";
        default: return "unknown";
    }
}

bool process_action_from_string(const std::string& text, ProcessAction& action) {
    if (text == "start") {
        action = ProcessAction::START;
    } else if (text == "end") {
        action = ProcessAction::END;
    } else {
        return false;
    }
    return true;
}

namespace {

FileType parse_file_type(const nlohmann::json& value) {
    FileType type;
    if (!file_type_from_string(value.get<std::string>(), type)) {
        throw std::invalid_argument("unknown path type: " + value.get<std::string>());
    }
    return type;
}

} // anonymous namespace

//=============================================================================
// Value types
//=============================================================================

void to_json(nlohmann::json& j, const FileChunk& chunk) {
    j = nlohmann::json{
        {"offset", chunk.offset},
        {"data", nlohmann::json::binary(chunk.data)}
    };
}

void from_json(const nlohmann::json& j, FileChunk& chunk) {
    chunk.offset = j.value("offset", static_cast<uint64_t>(0));

    const nlohmann::json& data = j.at("data");
    if (data.is_binary()) {
        const auto& bytes = data.get_binary();
        chunk.data.assign(bytes.begin(), bytes.end());
    } else if (data.is_array()) {
        // Encoders without a binary type send plain byte arrays
        data.get_to(chunk.data);
    } else {
        throw std::invalid_argument("chunk data must be binary or a byte array");
    }
}

void to_json(nlohmann::json& j, const Drive& drive) {
    j = nlohmann::json{
        {"display_name", drive.display_name},
        {"root_directory", drive.root_directory}
    };
}

void from_json(const nlohmann::json& j, Drive& drive) {
    drive.display_name = j.value("display_name", "");
    j.at("root_directory").get_to(drive.root_directory);
}

void to_json(nlohmann::json& j, const FileSystemEntry& entry) {
    j = nlohmann::json{
        {"name", entry.name},
        {"entry_type", file_type_to_string(entry.entry_type)},
        {"size", entry.size}
    };
    if (entry.last_access_time_utc) {
        j["last_access_time_utc"] = *entry.last_access_time_utc;
    }
    if (entry.content_type) {
        j["content_type"] = *entry.content_type;
    }
}

void from_json(const nlohmann::json& j, FileSystemEntry& entry) {
    j.at("name").get_to(entry.name);
    entry.entry_type = parse_file_type(j.at("entry_type"));
    entry.size = j.value("size", static_cast<uint64_t>(0));

    auto it = j.find("last_access_time_utc");
    if (it != j.end() && !it->is_null()) {
        entry.last_access_time_utc = it->get<int64_t>();
    } else {
        entry.last_access_time_utc.reset();
    }

    it = j.find("content_type");
    if (it != j.end() && !it->is_null()) {
        entry.content_type = it->get<std::string>();
    } else {
        entry.content_type.reset();
    }
}

//=============================================================================
// Transfer messages
//=============================================================================

void to_json(nlohmann::json& j, const FileTransferRequest& message) {
    j = nlohmann::json{{"id", message.id}, {"remote_path", message.remote_path}};
}

void from_json(const nlohmann::json& j, FileTransferRequest& message) {
    j.at("id").get_to(message.id);
    j.at("remote_path").get_to(message.remote_path);
}

void to_json(nlohmann::json& j, const FileTransferChunkMessage& message) {
    j = nlohmann::json{
        {"id", message.id},
        {"chunk", message.chunk},
        {"file_path", message.file_path},
        {"file_size", message.file_size}
    };
}

void from_json(const nlohmann::json& j, FileTransferChunkMessage& message) {
    j.at("id").get_to(message.id);
    j.at("chunk").get_to(message.chunk);
    message.file_path = j.value("file_path", "");
    j.at("file_size").get_to(message.file_size);
}

void to_json(nlohmann::json& j, const FileTransferCancel& message) {
    j = nlohmann::json{{"id", message.id}};
    if (!message.reason.empty()) {
        j["reason"] = message.reason;
    }
}

void from_json(const nlohmann::json& j, FileTransferCancel& message) {
    j.at("id").get_to(message.id);
    message.reason = j.value("reason", "");
}

void to_json(nlohmann::json& j, const FileTransferComplete& message) {
    j = nlohmann::json{{"id", message.id}, {"file_path", message.file_path}};
}

void from_json(const nlohmann::json& j, FileTransferComplete& message) {
    j.at("id").get_to(message.id);
    message.file_path = j.value("file_path", "");
}

//=============================================================================
// Remote filesystem messages
//=============================================================================

void to_json(nlohmann::json& j, const GetDrives&) {
    j = nlohmann::json::object();
}

void to_json(nlohmann::json& j, const GetDrivesResponse& message) {
    j = nlohmann::json{{"drives", message.drives}};
}

void from_json(const nlohmann::json& j, GetDrivesResponse& message) {
    message.drives.clear();
    auto it = j.find("drives");
    if (it != j.end() && !it->is_null()) {
        it->get_to(message.drives);
    }
}

void to_json(nlohmann::json& j, const GetDirectory& message) {
    j = nlohmann::json{{"remote_path", message.remote_path}};
}

void from_json(const nlohmann::json& j, GetDirectory& message) {
    j.at("remote_path").get_to(message.remote_path);
}

void to_json(nlohmann::json& j, const GetDirectoryResponse& message) {
    j = nlohmann::json{{"remote_path", message.remote_path}, {"items", message.items}};
}

void from_json(const nlohmann::json& j, GetDirectoryResponse& message) {
    j.at("remote_path").get_to(message.remote_path);
    message.items.clear();
    auto it = j.find("items");
    if (it != j.end() && !it->is_null()) {
        it->get_to(message.items);
    }
}

void to_json(nlohmann::json& j, const DoPathRename& message) {
    j = nlohmann::json{
        {"path", message.path},
        {"new_path", message.new_path},
        {"path_type", file_type_to_string(message.path_type)}
    };
}

void from_json(const nlohmann::json& j, DoPathRename& message) {
    j.at("path").get_to(message.path);
    j.at("new_path").get_to(message.new_path);
    message.path_type = parse_file_type(j.at("path_type"));
}

void to_json(nlohmann::json& j, const DoPathDelete& message) {
    j = nlohmann::json{
        {"path", message.path},
        {"path_type", file_type_to_string(message.path_type)}
    };
}

void from_json(const nlohmann::json& j, DoPathDelete& message) {
    j.at("path").get_to(message.path);
    message.path_type = parse_file_type(j.at("path_type"));
}

void to_json(nlohmann::json& j, const SetStatusFileManager& message) {
    j = nlohmann::json{{"message", message.message}};
}

void from_json(const nlohmann::json& j, SetStatusFileManager& message) {
    j.at("message").get_to(message.message);
}

//=============================================================================
// Process messages
//=============================================================================

void to_json(nlohmann::json& j, const DoProcessStart& message) {
    j = nlohmann::json{{"file_path", message.file_path}};
}

void from_json(const nlohmann::json& j, DoProcessStart& message) {
    j.at("file_path").get_to(message.file_path);
}

void to_json(nlohmann::json& j, const DoProcessResponse& message) {
    j = nlohmann::json{
        {"action", process_action_to_string(message.action)},
        {"result", message.result}
    };
}

void from_json(const nlohmann::json& j, DoProcessResponse& message) {
    std::string action = j.at("action").get<std::string>();
    if (!process_action_from_string(action, message.action)) {
        throw std::invalid_argument("unknown process action: " + action);
    }
    j.at("result").get_to(message.result);
}

} // namespace remotefm
