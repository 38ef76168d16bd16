#pragma once

#include <string>

// Format the time elapsed between two ISO timestamps as "just now", "42s ago",
// "5m ago", "3h ago", "12d ago". If now is empty, uses the current time.
// Returns "-" if then is empty, "?" on parse failure.
std::string format_time_ago(const std::string& then, const std::string& now = "");

// Format an ISO timestamp (UTC) as "YYYY-MM-DD HH:MM".
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
