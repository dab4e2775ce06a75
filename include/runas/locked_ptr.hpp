/*
    Copyright (c) 2011-2015 Andrey Sibiryov <me@kobology.ru>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.

    This file is part of Runas.

    Runas is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Runas is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef RUNAS_LOCKED_PTR_HPP
#define RUNAS_LOCKED_PTR_HPP

#include <mutex>
#include <utility>

namespace runas {

// Access to a value which holds its mutex for as long as it lives.
template<class T>
class locked_ptr {
    T* m_value;
    std::unique_lock<std::mutex> m_lock;

public:
    locked_ptr(T& value, std::mutex& mutex):
        m_value(&value),
        m_lock(mutex)
    { }

    locked_ptr(locked_ptr&& other) = default;

    T*
    operator->() const {
        return m_value;
    }

    T&
    operator*() const {
        return *m_value;
    }
};

// Owns a value and hands it out only under its own lock. A member access through operator-> holds
// the lock until the end of the full expression.
template<class T>
class synchronized {
    T m_value;
    mutable std::mutex m_mutex;

public:
    synchronized():
        m_value()
    { }

    auto
    synchronize() -> locked_ptr<T> {
        return locked_ptr<T>(m_value, m_mutex);
    }

    auto
    synchronize() const -> locked_ptr<const T> {
        return locked_ptr<const T>(m_value, m_mutex);
    }

    auto
    operator->() -> locked_ptr<T> {
        return synchronize();
    }

    auto
    operator->() const -> locked_ptr<const T> {
        return synchronize();
    }

    template<class F>
    auto
    apply(const F& functor) -> decltype(functor(std::declval<T&>())) {
        return functor(*synchronize());
    }

    template<class F>
    auto
    apply(const F& functor) const -> decltype(functor(std::declval<const T&>())) {
        return functor(*synchronize());
    }
};

} // namespace runas

#endif
