/**
 *    Copyright (C) 2025-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include "shardplan/base/status_with.h"

#include <iosfwd>
#include <string>
#include <utility>

namespace shardplan {

/**
 * Full name of a collection, "<db>.<collection>".
 */
class NamespaceString {
public:
    NamespaceString() = default;

    NamespaceString(std::string db, std::string coll)
        : _db(std::move(db)), _coll(std::move(coll)) {}

    /**
     * Parses "db.collection". The database part ends at the first dot; both parts must be
     * non-empty.
     */
    static StatusWith<NamespaceString> parse(const std::string& ns);

    const std::string& db() const {
        return _db;
    }

    const std::string& coll() const {
        return _coll;
    }

    std::string ns() const {
        return _db + "." + _coll;
    }

    std::string toString() const {
        return ns();
    }

    bool isEmpty() const {
        return _db.empty();
    }

    bool operator==(const NamespaceString& other) const {
        return _db == other._db && _coll == other._coll;
    }

    bool operator<(const NamespaceString& other) const {
        return ns() < other.ns();
    }

private:
    std::string _db;
    std::string _coll;
};

std::ostream& operator<<(std::ostream& os, const NamespaceString& nss);

}  // namespace shardplan
