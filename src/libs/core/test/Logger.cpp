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

#include <fstream>
#include <random>
#include <sstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/StreamLogger.hpp"

namespace mlcp::core::logging::tests
{
    namespace
    {
        std::string readFile(const std::filesystem::path& path)
        {
            std::ifstream ifs{ path };
            std::ostringstream oss;
            oss << ifs.rdbuf();
            return oss.str();
        }
    } // namespace

    TEST(Logger, severityNames)
    {
        EXPECT_EQ(getSeverityFromName("warning"), Severity::WARNING);
        EXPECT_EQ(getSeverityFromName("DEBUG"), Severity::DEBUG);
        EXPECT_EQ(getSeverityFromName("Fatal"), Severity::FATAL);
        EXPECT_EQ(getSeverityFromName("verbose"), std::nullopt);
        EXPECT_EQ(getSeverityFromName(""), std::nullopt);

        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
            EXPECT_EQ(getSeverityFromName(getSeverityName(severity)), severity);
    }

    TEST(Logger, noLogger)
    {
        ASSERT_FALSE(Service<ILogger>::exists());

        // must be a no-op
        MLCP_LOG(MAIN, ERROR, "nobody listens");
    }

    TEST(Logger, streamLogger)
    {
        std::ostringstream oss;
        {
            Service<ILogger> logger{ std::make_unique<StreamLogger>(oss) };

            MLCP_LOG(PURGE, INFO, "Removed " << 2 << " files");
            MLCP_LOG(PURGE, DEBUG, "not displayed");
            MLCP_LOG(CONFIG, WARNING, "Invalid value");
        }

        EXPECT_EQ(oss.str(), "[info] [PURGE] Removed 2 files\n[warning] [CONFIG] Invalid value\n");
    }

    TEST(Logger, streamLoggerAllSeverities)
    {
        std::ostringstream oss;
        {
            Service<ILogger> logger{ std::make_unique<StreamLogger>(oss, StreamLogger::allSeverities) };
            MLCP_LOG(UTILS, DEBUG, "displayed");
        }

        EXPECT_EQ(oss.str(), "[debug] [UTILS] displayed\n");
    }

    TEST(Logger, logFile)
    {
        const std::filesystem::path logFilePath{ std::filesystem::temp_directory_path() / ("mlcp-test-" + std::to_string(std::random_device{}()) + ".log") };

        {
            Service<ILogger> logger{ createLogger(Severity::INFO, logFilePath) };

            MLCP_LOG(MAIN, INFO, "first");
            MLCP_LOG(MAIN, DEBUG, "filtered out");
            MLCP_LOG(PURGE, ERROR, "second");
        }

        const std::string content{ readFile(logFilePath) };
        std::filesystem::remove(logFilePath);

        EXPECT_NE(content.find(" [info] [MAIN] first\n"), std::string::npos);
        EXPECT_NE(content.find(" [error] [PURGE] second\n"), std::string::npos);
        EXPECT_EQ(content.find("filtered out"), std::string::npos);
    }

    TEST(Logger, logFileCannotBeOpened)
    {
        EXPECT_THROW(createLogger(Severity::INFO, std::filesystem::temp_directory_path() / "mlcp-missing-directory" / "sub" / "mlcp.log"), SystemException);
    }
} // namespace mlcp::core::logging::tests
