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

#include "purge/FileTypes.hpp"

#include <algorithm>
#include <array>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "purge/Exception.hpp"

namespace mlcp::purge
{
    namespace
    {
        constexpr std::array<std::string_view, 17> defaultMusicFileExtensions{
            "aac", "aiff", "ape", "dff", "dsd", "dsf", "dxd", "flac", "iso", "m4a",
            "m4p", "mp3", "oga", "ogg", "wav", "wma", "wmv"
        };

        constexpr std::array<std::string_view, 28> defaultOtherAudioFileExtensions{
            "3gp", "aa", "aax", "act", "amr", "au", "awb", "dct", "dss", "dvf", "gsm", "iklax", "ivs",
            "m4b", "mmf", "mpc", "msv", "mogg", "opus", "ra", "rm", "raw", "sln", "tta", "vox", "wmv", "wv", "webm"
        };

        constexpr std::array<std::string_view, 2> defaultDocumentFileExtensions{ "txt", "pdf" };

        constexpr std::array<std::string_view, 3> defaultAlbumArtFileExtensions{ "jpg", "jpeg", "png" };

        constexpr std::array<std::string_view, 9> defaultAlbumArtFileNames{
            "album", "cover", "small_cover", "large_cover", "folder",
            "thumb", "albumartsmall", "albumartmedium", "albumartlarge"
        };

        std::vector<std::string> toStrings(std::span<const std::string_view> values)
        {
            return std::vector<std::string>(std::cbegin(values), std::cend(values));
        }

        // lower case, duplicates removed, leading '.' removed for extensions
        std::vector<std::string> readStrings(core::IConfig& config, std::string_view setting, std::span<const std::string_view> defs, bool isExtension)
        {
            std::vector<std::string> res;

            config.visitStrings(setting, [&](std::string_view value) {
                std::string str{ core::stringUtils::stringToLower(core::stringUtils::stringTrim(value)) };
                if (isExtension && !str.empty() && str.front() == '.')
                    str.erase(0, 1);

                if (str.empty())
                {
                    MLCP_LOG(CONFIG, WARNING, "Ignoring empty value in '" << setting << "'");
                    return;
                }

                if (std::find(std::cbegin(res), std::cend(res), str) == std::cend(res))
                    res.push_back(std::move(str));
            },
                defs);

            return res;
        }

        AlbumArtMatch readAlbumArtMatch(core::IConfig& config)
        {
            const std::string_view match{ config.getString("album-art-match", "any-image") };
            if (match == "any-image")
                return AlbumArtMatch::AnyImage;
            if (match == "file-names")
                return AlbumArtMatch::FileNames;

            throw Exception{ "Invalid config value for 'album-art-match'" };
        }
    } // namespace

    std::span<const std::string_view> getDefaultMusicFileExtensions()
    {
        return defaultMusicFileExtensions;
    }

    std::span<const std::string_view> getDefaultOtherAudioFileExtensions()
    {
        return defaultOtherAudioFileExtensions;
    }

    std::span<const std::string_view> getDefaultDocumentFileExtensions()
    {
        return defaultDocumentFileExtensions;
    }

    std::span<const std::string_view> getDefaultAlbumArtFileExtensions()
    {
        return defaultAlbumArtFileExtensions;
    }

    std::span<const std::string_view> getDefaultAlbumArtFileNames()
    {
        return defaultAlbumArtFileNames;
    }

    FileTypes getDefaultFileTypes()
    {
        FileTypes fileTypes;

        fileTypes.musicExtensions = toStrings(defaultMusicFileExtensions);
        fileTypes.otherAudioExtensions = toStrings(defaultOtherAudioFileExtensions);
        fileTypes.documentExtensions = toStrings(defaultDocumentFileExtensions);
        fileTypes.albumArtExtensions = toStrings(defaultAlbumArtFileExtensions);
        fileTypes.albumArtFileNames = toStrings(defaultAlbumArtFileNames);

        return fileTypes;
    }

    FileTypes readFileTypes(core::IConfig& config)
    {
        FileTypes fileTypes;

        fileTypes.musicExtensions = readStrings(config, "music-file-extensions", defaultMusicFileExtensions, true);
        fileTypes.otherAudioExtensions = readStrings(config, "other-audio-file-extensions", defaultOtherAudioFileExtensions, true);
        fileTypes.documentExtensions = readStrings(config, "document-file-extensions", defaultDocumentFileExtensions, true);
        fileTypes.albumArtExtensions = readStrings(config, "album-art-file-extensions", defaultAlbumArtFileExtensions, true);
        fileTypes.albumArtFileNames = readStrings(config, "album-art-file-names", defaultAlbumArtFileNames, false);
        fileTypes.albumArtMatch = readAlbumArtMatch(config);
        fileTypes.albumArtRequiresMusic = config.getBool("album-art-require-music", true);

        MLCP_LOG(CONFIG, INFO, "Music file extensions: " << core::stringUtils::joinStrings(fileTypes.musicExtensions, ","));
        MLCP_LOG(CONFIG, INFO, "Other audio file extensions: " << core::stringUtils::joinStrings(fileTypes.otherAudioExtensions, ","));
        MLCP_LOG(CONFIG, INFO, "Document file extensions: " << core::stringUtils::joinStrings(fileTypes.documentExtensions, ","));
        MLCP_LOG(CONFIG, INFO, "Album art file extensions: " << core::stringUtils::joinStrings(fileTypes.albumArtExtensions, ","));
        MLCP_LOG(CONFIG, INFO, "Album art file names: " << core::stringUtils::joinStrings(fileTypes.albumArtFileNames, ","));

        // every music file would be purged otherwise
        if (fileTypes.musicExtensions.empty())
            throw Exception{ "Invalid config value for 'music-file-extensions': at least one extension is required" };

        return fileTypes;
    }
} // namespace mlcp::purge
