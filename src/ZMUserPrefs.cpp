//
//  ZMUserPrefs.cpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#include "ZMUserPrefs.hpp"
#include "ZMErrorReporter.hpp"
#include "ZMLock.hpp"

#include <map>
#include <set>

#include <stdlib.h>
#include <strings.h>

static ZMLock prefsLock;

// Created on first use so static-initialization order doesn't matter
static std::map<std::string, std::string> *
prefsStore() {
    static std::map<std::string, std::string> *store = new std::map<std::string, std::string>;
    return store;
}

// Names already reported for an unparseable boolean; caller must hold prefsLock
static std::set<std::string> *
warnedBoolPrefs() {
    static std::set<std::string> *warned = new std::set<std::string>;
    return warned;
}

// Caller must hold prefsLock
static bool
lookupPref(const char  *name,
           std::string *value) {
    ZMAssert(name);
    std::map<std::string, std::string>::const_iterator it = prefsStore()->find(name);
    if (it != prefsStore()->end()) {
        *value = it->second;
        return true;
    }
    const char *env = getenv(name);
    if (env) {
        *value = env;
        return true;
    }
    return false;
}

/*static*/ std::string
ZMUserPrefs::stringPref(const char *name) {
    ZMLockHolder holder(&prefsLock);
    std::string value;
    if (!lookupPref(name, &value)) {
        return "";
    }
    return value;
}

/*static*/ bool
ZMUserPrefs::boolPref(const char *name) {
    std::string value = stringPref(name);
    if (value.empty()) {
        return false;
    }
    const char *s = value.c_str();
    if (strcasecmp(s, "1") == 0 ||
        strcasecmp(s, "true") == 0 ||
        strcasecmp(s, "yes") == 0) {
        return true;
    }
    if (strcasecmp(s, "0") != 0 &&
        strcasecmp(s, "false") != 0 &&
        strcasecmp(s, "no") != 0) {
        bool firstTime;
        {
            ZMLockHolder holder(&prefsLock);
            firstTime = warnedBoolPrefs()->insert(name).second;
        }
        if (firstTime) {  // Once per name
            ZMErrorReporter::logError("ZMUserPrefs", "Unrecognized boolean value '%s' for %s; using false", s, name);
        }
    }
    return false;
}

/*static*/ bool
ZMUserPrefs::hasPref(const char *name) {
    ZMLockHolder holder(&prefsLock);
    std::string value;
    return lookupPref(name, &value);
}

/*static*/ void
ZMUserPrefs::setPref(const char        *name,
                     const std::string &value) {
    ZMAssert(name);
    ZMLockHolder holder(&prefsLock);
    (*prefsStore())[name] = value;
}

/*static*/ void
ZMUserPrefs::setPref(const char *name,
                     bool       value) {
    setPref(name, std::string(value ? "true" : "false"));
}

/*static*/ void
ZMUserPrefs::removePref(const char *name) {
    ZMAssert(name);
    ZMLockHolder holder(&prefsLock);
    prefsStore()->erase(name);
}
