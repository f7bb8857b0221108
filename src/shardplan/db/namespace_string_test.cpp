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

#include "shardplan/db/namespace_string.h"

#include "shardplan/unittest/unittest.h"

namespace shardplan {
namespace {

TEST(NamespaceStringTest, Parse) {
    auto swNss = NamespaceString::parse("marketplace.products");
    ASSERT_OK(swNss);
    ASSERT_EQ("marketplace", swNss.getValue().db());
    ASSERT_EQ("products", swNss.getValue().coll());
    ASSERT_EQ("marketplace.products", swNss.getValue().ns());
}

TEST(NamespaceStringTest, CollectionMayContainDots) {
    auto swNss = NamespaceString::parse("db.system.chunks");
    ASSERT_OK(swNss);
    ASSERT_EQ("db", swNss.getValue().db());
    ASSERT_EQ("system.chunks", swNss.getValue().coll());
}

TEST(NamespaceStringTest, RejectsMalformed) {
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse("products"));
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse(".products"));
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse("marketplace."));
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse(""));
}

TEST(NamespaceStringTest, RejectsInvalidCharacters) {
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse("market place.products"));
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse("market$.products"));
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, NamespaceString::parse("a/b.products"));
}

TEST(NamespaceStringTest, DefaultIsEmpty) {
    ASSERT(NamespaceString().isEmpty());
    ASSERT_FALSE(NamespaceString("db", "coll").isEmpty());
}

}  // namespace
}  // namespace shardplan
