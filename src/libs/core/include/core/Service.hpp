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

#include <cassert>
#include <memory>

namespace mlcp::core
{
    // Process wide access to a single instance of an interface
    // The instance lives as long as the Service object that owns it
    template<typename Class>
    class Service
    {
    public:
        Service(std::unique_ptr<Class> service)
        {
            assert(!_service);
            _service = std::move(service);
        }

        ~Service()
        {
            _service.reset();
        }

        Service(const Service&) = delete;
        Service(Service&&) = delete;
        Service& operator=(const Service&) = delete;
        Service& operator=(Service&&) = delete;

        static Class* get() { return _service.get(); }
        static bool exists() { return static_cast<bool>(_service); }

    private:
        static inline std::unique_ptr<Class> _service;
    };
} // namespace mlcp::core
