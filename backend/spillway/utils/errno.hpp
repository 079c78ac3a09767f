#pragma once

// returns the symbolic name of the current errno value
const char* errnoStr();
