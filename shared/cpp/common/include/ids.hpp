#pragma once
#include <string>

// 128 random bits as 32 lowercase hex chars. Used for message, correlation,
// task and agent ids.
std::string generate_id();
