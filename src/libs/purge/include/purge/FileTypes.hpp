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

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mlcp::core
{
    class IConfig;
}

namespace mlcp::purge
{
    // How image files are recognized as folder-level album art
    enum class AlbumArtMatch
    {
        AnyImage,  // any file with an album art extension
        FileNames, // only files whose stem is one of the album art file names
    };

    // Extensions are lower case, without the leading dot
    struct FileTypes
    {
        std::vector<std::string> musicExtensions;
        std::vector<std::string> otherAudioExtensions;
        std::vector<std::string> documentExtensions;
        std::vector<std::string> albumArtExtensions;
        std::vector<std::string> albumArtFileNames;
        AlbumArtMatch albumArtMatch{ AlbumArtMatch::AnyImage };
        bool albumArtRequiresMusic{ true }; // art must sit in a folder that directly contains music files
    };

    std::span<const std::string_view> getDefaultMusicFileExtensions();
    std::span<const std::string_view> getDefaultOtherAudioFileExtensions();
    std::span<const std::string_view> getDefaultDocumentFileExtensions();
    std::span<const std::string_view> getDefaultAlbumArtFileExtensions();
    std::span<const std::string_view> getDefaultAlbumArtFileNames();

    FileTypes getDefaultFileTypes();

    // Missing settings fall back to the defaults
    // throws Exception on invalid values, core::MlcpException on settings that are not lists of strings
    FileTypes readFileTypes(core::IConfig& config);
} // namespace mlcp::purge
