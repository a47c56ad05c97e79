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

#include <gtest/gtest.h>

#include "purge/Classifier.hpp"
#include "purge/FileTypes.hpp"

namespace mlcp::purge::tests
{
    TEST(Classifier, music)
    {
        const FileTypes fileTypes{ getDefaultFileTypes() };
        const Classifier classifier{ fileTypes };

        for (const std::string_view extension : getDefaultMusicFileExtensions())
        {
            const std::filesystem::path file{ "/library/album/track." + std::string{ extension } };
            EXPECT_EQ(classifier.classify(file, true), Category::Music) << file;
            EXPECT_EQ(classifier.classify(file, false), Category::Music) << file;
        }

        EXPECT_EQ(classifier.classify("/library/SONG.MP3", false), Category::Music);
        EXPECT_EQ(classifier.classify("/library/Song.FlAc", false), Category::Music);
        EXPECT_EQ(classifier.classify("/library/01 - intro.m4a", false), Category::Music);
    }

    TEST(Classifier, musicTakesPrecedence)
    {
        const FileTypes fileTypes{ getDefaultFileTypes() };
        const Classifier classifier{ fileTypes };

        // listed in both music and other audio types
        EXPECT_EQ(classifier.classify("/library/clip.wmv", false), Category::Music);
    }

    TEST(Classifier, otherAudioAndDocuments)
    {
        const FileTypes fileTypes{ getDefaultFileTypes() };
        const Classifier classifier{ fileTypes };

        EXPECT_EQ(classifier.classify("/library/ringtone.amr", true), Category::OtherAudio);
        EXPECT_EQ(classifier.classify("/library/book.M4B", true), Category::OtherAudio);
        EXPECT_EQ(classifier.classify("/library/notes.txt", true), Category::Document);
        EXPECT_EQ(classifier.classify("/library/Booklet.PDF", false), Category::Document);
    }

    TEST(Classifier, albumArt)
    {
        const FileTypes fileTypes{ getDefaultFileTypes() };
        const Classifier classifier{ fileTypes };

        EXPECT_EQ(classifier.classify("/library/album/cover.jpg", true), Category::AlbumArt);
        EXPECT_EQ(classifier.classify("/library/album/scan-01.JPEG", true), Category::AlbumArt);
        EXPECT_EQ(classifier.classify("/library/album/back.png", true), Category::AlbumArt);

        // not in a music folder
        EXPECT_EQ(classifier.classify("/library/album/cover.jpg", false), Category::Unknown);

        // not an album art type
        EXPECT_EQ(classifier.classify("/library/album/cover.gif", true), Category::Unknown);
    }

    TEST(Classifier, albumArtWithoutMusicRequirement)
    {
        FileTypes fileTypes{ getDefaultFileTypes() };
        fileTypes.albumArtRequiresMusic = false;
        const Classifier classifier{ fileTypes };

        EXPECT_EQ(classifier.classify("/library/album/cover.jpg", false), Category::AlbumArt);
        EXPECT_EQ(classifier.classify("/library/album/cover.jpg", true), Category::AlbumArt);
    }

    TEST(Classifier, albumArtFileNames)
    {
        FileTypes fileTypes{ getDefaultFileTypes() };
        fileTypes.albumArtMatch = AlbumArtMatch::FileNames;
        const Classifier classifier{ fileTypes };

        EXPECT_EQ(classifier.classify("/library/album/cover.jpg", true), Category::AlbumArt);
        EXPECT_EQ(classifier.classify("/library/album/Folder.JPG", true), Category::AlbumArt);
        EXPECT_EQ(classifier.classify("/library/album/AlbumArtSmall.png", true), Category::AlbumArt);
        EXPECT_EQ(classifier.classify("/library/album/scan-01.jpg", true), Category::Unknown);
        EXPECT_EQ(classifier.classify("/library/album/cover.jpg", false), Category::Unknown);
    }

    TEST(Classifier, unknown)
    {
        const FileTypes fileTypes{ getDefaultFileTypes() };
        const Classifier classifier{ fileTypes };

        for (const std::filesystem::path file : { "/library/README", "/library/.DS_Store", "/library/Thumbs.db", "/library/file.", "/library/song.mp3.part", "/library/archive.zip", "/library/mp3" })
        {
            EXPECT_EQ(classifier.classify(file, true), Category::Unknown) << file;
            EXPECT_EQ(classifier.classify(file, false), Category::Unknown) << file;
        }
    }

    TEST(Classifier, containsMusicFile)
    {
        const FileTypes fileTypes{ getDefaultFileTypes() };
        const Classifier classifier{ fileTypes };

        EXPECT_FALSE(classifier.containsMusicFile({}));

        const std::vector<std::filesystem::path> withoutMusic{ "/a/cover.jpg", "/a/notes.txt", "/a/ringtone.amr" };
        EXPECT_FALSE(classifier.containsMusicFile(withoutMusic));

        const std::vector<std::filesystem::path> withMusic{ "/a/cover.jpg", "/a/track.FLAC" };
        EXPECT_TRUE(classifier.containsMusicFile(withMusic));
    }

    TEST(Classifier, customFileTypes)
    {
        FileTypes fileTypes;
        fileTypes.musicExtensions = { "mka" };
        fileTypes.documentExtensions = { "nfo" };
        const Classifier classifier{ fileTypes };

        EXPECT_EQ(classifier.classify("/library/track.mka", false), Category::Music);
        EXPECT_EQ(classifier.classify("/library/track.mp3", false), Category::Unknown);
        EXPECT_EQ(classifier.classify("/library/release.nfo", false), Category::Document);
        EXPECT_EQ(classifier.classify("/library/cover.jpg", true), Category::Unknown);
    }
} // namespace mlcp::purge::tests
