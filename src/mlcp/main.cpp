/*
 * Copyright (C) 2024 Emeric Poupon
 *
 * This file is part of mlcp.
 *
 * mlcp is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * mlcp is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with mlcp.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "purge/FileTypes.hpp"
#include "purge/IPurgeEngine.hpp"

namespace mlcp
{
    namespace
    {
        constexpr const char* description{
            "Purge, or backup, \"crud\" files from a music library.\n"
            "\n"
            "\"Crud\" files are files that aren't one of the types designated to keep.\n"
            "By default, this deletes all non-music files and document/booklet files\n"
            "(see --list-types) but preserves folder-level album art.\n"
            "\n"
            "Unless --purge is specified, NO changes to the library will occur: the\n"
            "process is only simulated, so that its effects can be evaluated first\n"
            "(with --verbose).\n"
            "\n"
            "If <backup-path> is specified, purged files are copied there before being\n"
            "deleted. The library folder structure is preserved, so that they can be\n"
            "merged back by copying the backup root to the library root.\n"
        };

        core::logging::Severity getLogMinSeverity(core::IConfig* config)
        {
            if (!config)
                return core::logging::defaultMinSeverity;

            const std::string_view severityName{ config->getString("log-min-severity", core::logging::getSeverityName(core::logging::defaultMinSeverity)) };
            const std::optional<core::logging::Severity> severity{ core::logging::getSeverityFromName(severityName) };
            if (!severity)
                throw core::MlcpException{ "Invalid config value for 'log-min-severity'" };

            return *severity;
        }

        void listTypes(std::ostream& os, const purge::FileTypes& fileTypes)
        {
            os << "Music file types (never purged): " << core::stringUtils::joinStrings(fileTypes.musicExtensions, ", ") << std::endl;
            os << "Other audio file types (purged unless --other-audio): " << core::stringUtils::joinStrings(fileTypes.otherAudioExtensions, ", ") << std::endl;
            os << "Document/booklet file types (purged unless --documents): " << core::stringUtils::joinStrings(fileTypes.documentExtensions, ", ") << std::endl;

            os << "Album art file types (purged with --art): " << core::stringUtils::joinStrings(fileTypes.albumArtExtensions, ", ");
            if (fileTypes.albumArtMatch == purge::AlbumArtMatch::FileNames)
                os << " named " << core::stringUtils::joinStrings(fileTypes.albumArtFileNames, ", ");
            if (fileTypes.albumArtRequiresMusic)
                os << ", in folders containing music files";
            os << std::endl;
        }
    } // namespace
} // namespace mlcp

int main(int argc, char* argv[])
{
    try
    {
        using namespace mlcp;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("version,V", "Display version information")
            ("purge,p", "Perform the actual file purge, otherwise the process is only simulated")
            ("art,a", "Purge folder-level album art")
            ("other-audio,o", "Keep other (non-music) audio files")
            ("documents,d", "Keep document/booklet files")
            ("list-types,l", "List music, other audio and document file types")
            ("verbose,v", "Output the path of every file that is purged or backed-up")
            ("config,c", program_options::value<std::string>(), "Configuration file");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        // clang-format off
        hiddenOptions.add_options()
            ("library-path", program_options::value<std::string>(), "Root folder of the music library to be purged")
            ("backup-path", program_options::value<std::string>(), "Root folder for backing up purged files");
        // clang-format on

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("library-path", 1).add("backup-path", 1);

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv)
                                   .options(allOptions)
                                   .positional(positional)
                                   .run(),
            vm);

        program_options::notify(vm);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] <library-path> [<backup-path>]" << std::endl;
            os << std::endl
               << description << std::endl;
            os << options << std::endl;
        };

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (vm.count("version"))
        {
            std::cout << "mlcp " << QUOTEME(MLCP_VERSION) << std::endl;
            return EXIT_SUCCESS;
        }

        core::Service<core::IConfig> configService{ vm.count("config") ? core::createConfig(vm["config"].as<std::string>()) : nullptr };
        core::IConfig* const config{ core::Service<core::IConfig>::get() };

        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(config), config ? config->getPath("log-file", {}) : std::filesystem::path{}) };

        if (config)
            MLCP_LOG(MAIN, INFO, "Using config file '" << vm["config"].as<std::string>() << "'");

        const purge::FileTypes fileTypes{ config ? purge::readFileTypes(*config) : purge::getDefaultFileTypes() };

        if (vm.count("list-types"))
        {
            for (const char* option : { "library-path", "backup-path", "purge", "art", "other-audio", "documents", "verbose" })
            {
                if (vm.count(option))
                {
                    std::cerr << "Option '--list-types' cannot be used with '" << option << "'" << std::endl;
                    return EXIT_FAILURE;
                }
            }

            listTypes(std::cout, fileTypes);
            return EXIT_SUCCESS;
        }

        if (vm.count("library-path") == 0)
        {
            std::cerr << "No library path provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        purge::PurgeSettings settings;
        settings.libraryPath = vm["library-path"].as<std::string>();
        if (vm.count("backup-path"))
            settings.backupPath = vm["backup-path"].as<std::string>();
        settings.options.purgeArt = vm.count("art") > 0;
        settings.options.keepDocuments = vm.count("documents") > 0;
        settings.options.keepOtherAudio = vm.count("other-audio") > 0;
        settings.purge = vm.count("purge") > 0;
        settings.verbose = vm.count("verbose") > 0;
        if (config)
        {
            settings.skipResourceForks = config->getBool("skip-resource-forks", true);
            settings.verifyBackup = config->getBool("verify-backup", true);
        }

        const std::unique_ptr<purge::IPurgeEngine> engine{ purge::createPurgeEngine(fileTypes) };
        const purge::RunSummary summary{ engine->run(settings) };

        for (const std::string& line : summary.logLines)
            std::cout << line << std::endl;

        // the closing line is part of the verbose output, failures are always reported
        if (summary.errors.empty())
        {
            if (settings.verbose)
                std::cout << summary.removed << " files successfully " << purge::getOperationName(summary.operation) << "." << std::endl;
            return EXIT_SUCCESS;
        }

        if (settings.verbose)
            std::cout << summary.errors.size() << " errors out of " << summary.getCandidateCount() << " files." << std::endl;
        else
            MLCP_LOG(MAIN, ERROR, summary.errors.size() << " errors out of " << summary.getCandidateCount() << " files");
        return EXIT_FAILURE;
    }
    catch (const boost::program_options::error& e)
    {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
