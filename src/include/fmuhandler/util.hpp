/**
\file
\brief Internal utilities.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_UTIL_HPP
#define FMUHANDLER_UTIL_HPP

#include <cstddef>
#include <string>
#include <utility>

#include <fmuhandler/config.h>
#include <boost/noncopyable.hpp>


namespace fmuhandler
{

/// Utilities shared by the library modules.
namespace util
{


/**
\brief  Returns `size` characters picked at random from the null-terminated
        `charSet`.

\throws std::invalid_argument
    If `charSet` is null or empty.
*/
std::string RandomString(std::size_t size, const char* charSet);


/**
\brief  Runs an action when it goes out of scope, unless dismissed.

Use OnScopeExit() to create one.
*/
template<typename Action>
class ScopeGuard : boost::noncopyable
{
public:
    explicit ScopeGuard(Action action) : m_active(true), m_action(action) { }

    ScopeGuard(ScopeGuard&& other)
        : m_active(other.m_active), m_action(std::move(other.m_action))
    {
        other.m_active = false;
    }

    ~ScopeGuard() { if (m_active) m_action(); }

    /// Prevents the action from being executed on scope exit.
    void Dismiss() FMUHANDLER_NOEXCEPT { m_active = false; }

private:
    bool m_active;
    Action m_action;
};


/**
\brief  Returns a guard which calls `action` when it is destroyed.

~~~{.cpp}
auto doc = xmlReadMemory(...);
auto freeDoc = OnScopeExit([doc] () { xmlFreeDoc(doc); });
~~~
*/
template<typename Action>
ScopeGuard<Action> OnScopeExit(Action action) { return ScopeGuard<Action>(action); }


}}      // namespace
#endif  // header guard
