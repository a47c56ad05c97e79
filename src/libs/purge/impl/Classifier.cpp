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

#include "purge/Classifier.hpp"

#include <algorithm>

#include "core/Path.hpp"
#include "core/String.hpp"
#include "purge/FileTypes.hpp"

namespace mlcp::purge
{
    Classifier::Classifier(const FileTypes& fileTypes)
        : _fileTypes{ fileTypes }
    {
    }

    Category Classifier::classify(const std::filesystem::path& file, bool inMusicDirectory) const
    {
        // order matters: an extension can be listed in several categories
        if (isMusicFile(file))
            return Category::Music;
        if (isAlbumArt(file, inMusicDirectory))
            return Category::AlbumArt;
        if (core::pathUtils::hasFileAnyExtension(file, _fileTypes.otherAudioExtensions))
            return Category::OtherAudio;
        if (core::pathUtils::hasFileAnyExtension(file, _fileTypes.documentExtensions))
            return Category::Document;

        return Category::Unknown;
    }

    bool Classifier::isMusicFile(const std::filesystem::path& file) const
    {
        return core::pathUtils::hasFileAnyExtension(file, _fileTypes.musicExtensions);
    }

    bool Classifier::containsMusicFile(std::span<const std::filesystem::path> files) const
    {
        return std::any_of(std::cbegin(files), std::cend(files), [this](const std::filesystem::path& file) { return isMusicFile(file); });
    }

    bool Classifier::isAlbumArt(const std::filesystem::path& file, bool inMusicDirectory) const
    {
        if (_fileTypes.albumArtRequiresMusic && !inMusicDirectory)
            return false;

        if (!core::pathUtils::hasFileAnyExtension(file, _fileTypes.albumArtExtensions))
            return false;

        switch (_fileTypes.albumArtMatch)
        {
        case AlbumArtMatch::AnyImage:
            return true;

        case AlbumArtMatch::FileNames:
            {
                const std::string stem{ core::stringUtils::stringToLower(file.stem().string()) };
                return std::find(std::cbegin(_fileTypes.albumArtFileNames), std::cend(_fileTypes.albumArtFileNames), stem) != std::cend(_fileTypes.albumArtFileNames);
            }
        }

        return false;
    }
} // namespace mlcp::purge
