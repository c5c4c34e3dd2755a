/**
 * \file daemon/ConsoleCommands.cpp
 * \brief Implementation of the interactive console commands.
 */
#include "ConsoleCommands.hpp"
#include "device/DeviceError.hpp"
#include "device/DeviceHandle.hpp"

#include <sstream>
#include <stdexcept>
#include <system_error>

namespace SpeakerLink {

namespace {

std::string join(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += " ";
        out += id;
    }
    return out;
}

std::string role_of(const DeviceAttributes& a) {
    if (a.is_master) return "master";
    if (a.is_slave) return "slave of " + a.master_address;
    return "-";
}

} // namespace

ConsoleCommands::ConsoleCommands(GroupCoordinator& coordinator,
                                 std::shared_ptr<SimulatedNetwork> network,
                                 std::ostream& out,
                                 std::shared_ptr<Logger> logger)
    : coordinator_(coordinator)
    , network_(std::move(network))
    , out_(out)
    , logger_(std::move(logger))
{
}

bool ConsoleCommands::execute(const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    std::vector<std::string> args;
    for (std::string word; in >> word;) args.push_back(word);

    if (cmd.empty()) return true;
    if (cmd == "quit" || cmd == "exit") return false;

    try {
        if (cmd == "status") status();
        else if (cmd == "members") members(args);
        else if (cmd == "join") join(args);
        else if (cmd == "leave") leave(args);
        else if (cmd == "ungroup") ungroup(args);
        else if (cmd == "volume") volume(args);
        else if (cmd == "drop") drop(args, false);
        else if (cmd == "restore") drop(args, true);
        else if (cmd == "help") help();
        else out_ << "unknown command '" << cmd << "' (try help)\n";
    } catch (const std::system_error& e) {
        out_ << "error: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        out_ << "usage: " << e.what() << "\n";
    } catch (const std::out_of_range& e) {
        out_ << "error: " << e.what() << "\n";
    }
    return true;
}

std::shared_ptr<DeviceHandle> ConsoleCommands::require_device(const std::string& id) {
    auto handle = coordinator_.find_device(id);
    if (!handle) throw_device_error(DeviceErrc::not_found, "no speaker with id '" + id + "'");
    return handle;
}

void ConsoleCommands::status() {
    for (const auto& id : coordinator_.device_ids()) {
        auto handle = coordinator_.find_device(id);
        if (!handle) continue;
        const auto a = handle->attributes();
        out_ << id << "  " << handle->label() << "  " << to_string(handle->connection_state())
             << "  volume " << a.volume << (a.muted ? " (muted)" : "")
             << "  " << a.playback_state << "  " << role_of(a);
        if (a.is_master) out_ << " of " << a.number_of_members;
        out_ << "\n";
    }
    if (auto pending = coordinator_.pending_operation()) {
        out_ << "pending: " << pending->master_id << " add [" << SpeakerLink::join(pending->to_add)
             << "] remove [" << SpeakerLink::join(pending->to_remove) << "]"
             << (pending->in_progress ? " (in progress)" : "") << "\n";
    }
}

void ConsoleCommands::members(const std::vector<std::string>& args) {
    if (args.size() != 1) throw std::invalid_argument("members <id>");
    require_device(args[0]);
    auto group = coordinator_.resolve_group_members(args[0]);
    if (!group) {
        out_ << args[0] << " is not grouped\n";
        return;
    }
    out_ << SpeakerLink::join(*group) << "\n";
}

void ConsoleCommands::join(const std::vector<std::string>& args) {
    if (args.size() < 2) throw std::invalid_argument("join <master> <id>...");
    std::vector<DeviceId> ids(args.begin() + 1, args.end());
    coordinator_.request_add_to_group(args[0], ids);
    out_ << "queued: " << SpeakerLink::join(ids) << " -> " << args[0] << "\n";
}

void ConsoleCommands::leave(const std::vector<std::string>& args) {
    if (args.size() != 2) throw std::invalid_argument("leave <master> <id>");
    coordinator_.request_remove_from_group(args[0], args[1]);
    out_ << "queued: " << args[1] << " leaves " << args[0] << "\n";
}

void ConsoleCommands::ungroup(const std::vector<std::string>& args) {
    if (args.size() != 1) throw std::invalid_argument("ungroup <id>");
    coordinator_.request_ungroup(args[0]);
    out_ << "queued: ungroup " << args[0] << "\n";
}

void ConsoleCommands::volume(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) throw std::invalid_argument("volume <id> [0-100]");
    auto handle = require_device(args[0]);
    if (args.size() == 1) {
        out_ << args[0] << " volume " << handle->get_volume() << "\n";
        return;
    }
    int level = 0;
    try {
        level = std::stoi(args[1]);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("volume <id> [0-100]");
    }
    handle->set_volume(level);
    out_ << args[0] << " volume set to " << level << "\n";
}

void ConsoleCommands::drop(const std::vector<std::string>& args, bool restore) {
    if (args.size() != 1) throw std::invalid_argument(restore ? "restore <id>" : "drop <id>");
    if (!network_) {
        out_ << "link simulation needs the simulated client backend\n";
        return;
    }
    auto handle = require_device(args[0]);
    if (restore) {
        network_->restore(handle->host());
        out_ << "link to " << args[0] << " restored\n";
        return;
    }

    network_->drop(handle->host());
    if (logger_) logger_->info("Simulating link loss to " + args[0]);
    try {
        // The failing probe hands the device to the reconnect loop.
        handle->get_volume();
    } catch (const std::system_error& e) {
        out_ << "link to " << args[0] << " dropped: " << e.what() << "\n";
        return;
    }
    out_ << "link to " << args[0] << " dropped\n";
}

void ConsoleCommands::help() {
    out_ << "status                     list speakers and the pending grouping\n"
         << "members <id>               group of <id>, master first\n"
         << "join <master> <id>...      add speakers to the group of <master>\n"
         << "leave <master> <id>        remove <id> from the group of <master>\n"
         << "ungroup <id>               dissolve or leave the group of <id>\n"
         << "volume <id> [0-100]        read or set volume\n"
         << "drop <id> / restore <id>   simulate link loss and recovery\n"
         << "quit                       shut down\n";
}

} // namespace SpeakerLink
