#pragma once

#include "collwatch/plan.h"

#include <nlohmann/json.hpp>

#include <string>

// build_report describes every locale decision of a plan as JSON.
nlohmann::ordered_json build_report(const collwatch::plan::Plan& p, const std::string& locale_root,
                                    bool execute);

// write_report writes the report pretty-printed. Throws std::runtime_error
// if the file cannot be created.
void write_report(const std::string& path, const nlohmann::ordered_json& doc);
