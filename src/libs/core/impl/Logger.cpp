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

#include "Logger.hpp"

#include <cassert>
#include <iostream>

#include <Wt/WDateTime.h>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace mlcp::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CONFIG:
            return "CONFIG";
        case Module::MAIN:
            return "MAIN";
        case Module::PURGE:
            return "PURGE";
        case Module::UTILS:
            return "UTILS";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    std::optional<Severity> getSeverityFromName(std::string_view name)
    {
        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
        {
            if (stringUtils::stringCaseInsensitiveEqual(name, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw SystemException{ ec, "Cannot open log file '" + logFilePath.string() + "' for writing" };
            }
        }

        switch (minSeverity)
        {
        case Severity::DEBUG:
            addOutputStream(_logFileStream ? *_logFileStream : std::cout, Severity::DEBUG);
            [[fallthrough]];
        case Severity::INFO:
            addOutputStream(_logFileStream ? *_logFileStream : std::cout, Severity::INFO);
            [[fallthrough]];
        case Severity::WARNING:
            addOutputStream(_logFileStream ? *_logFileStream : std::cerr, Severity::WARNING);
            [[fallthrough]];
        case Severity::ERROR:
            addOutputStream(_logFileStream ? *_logFileStream : std::cerr, Severity::ERROR);
            [[fallthrough]];
        case Severity::FATAL:
            addOutputStream(_logFileStream ? *_logFileStream : std::cerr, Severity::FATAL);
            break;
        }
    }

    Logger::~Logger() = default;

    void Logger::addOutputStream(std::ostream& os, Severity severity)
    {
        assert(!_severityToOutputStreamMap.contains(severity));
        _severityToOutputStreamMap.emplace(severity, &os);
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        return _severityToOutputStreamMap.contains(severity);
    }

    void Logger::processLog(const Log& log)
    {
        assert(isSeverityActive(log.getSeverity())); // should have been filtered out by a isSeverityActive call
        std::ostream& os{ *_severityToOutputStreamMap.at(log.getSeverity()) };

        os << stringUtils::toISO8601String(Wt::WDateTime::currentDateTime()) << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage() << std::endl;
    }
} // namespace mlcp::core::logging
