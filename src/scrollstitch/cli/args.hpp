#pragma once
#include <stdexcept>
#include <string>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the mode.
      Example:   prog simulate --overlap=100 --save=out.png
    - Keys are case-sensitive.

  A missing key yields the default value; a value that is present but not a
  number throws std::invalid_argument naming the key.
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Get int value for "--key=value". Returns 'def' when missing. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(v, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used != v.size()) throw std::invalid_argument("--" + key + " expects an integer, got '" + v + "'");
    return out;
}

/* Get double value for "--key=value". Returns 'def' when missing. */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used != v.size()) throw std::invalid_argument("--" + key + " expects a number, got '" + v + "'");
    return out;
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}
