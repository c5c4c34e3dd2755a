/**
 * \file daemon/ConsoleCommands.hpp
 * \brief Line-oriented operator commands for the interactive daemon mode.
 */
#pragma once

#include "client/SimulatedNetwork.hpp"
#include "group/GroupCoordinator.hpp"
#include "logger.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace SpeakerLink {

/**
 * \brief Executes console commands against the coordinator and its devices.
 *
 * Commands: status, members, join, leave, ungroup, volume, drop, restore,
 * help, quit. Results and errors are written to the output stream; grouping
 * commands print when the episode has been handed to the settle timer, not
 * when it completes.
 */
class ConsoleCommands {
public:
    /**
     * \param network Simulated network for \c drop / \c restore; may be null
     *        when another client backend is in use.
     */
    ConsoleCommands(GroupCoordinator& coordinator,
                    std::shared_ptr<SimulatedNetwork> network,
                    std::ostream& out,
                    std::shared_ptr<Logger> logger = nullptr);

    /**
     * \brief Run one command line.
     * \return false once \c quit was requested.
     */
    bool execute(const std::string& line);

private:
    void status();
    void members(const std::vector<std::string>& args);
    void join(const std::vector<std::string>& args);
    void leave(const std::vector<std::string>& args);
    void ungroup(const std::vector<std::string>& args);
    void volume(const std::vector<std::string>& args);
    void drop(const std::vector<std::string>& args, bool restore);
    void help();

    std::shared_ptr<DeviceHandle> require_device(const std::string& id);

    GroupCoordinator& coordinator_;
    std::shared_ptr<SimulatedNetwork> network_;
    std::ostream& out_;
    std::shared_ptr<Logger> logger_;
};

} // namespace SpeakerLink
