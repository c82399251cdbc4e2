#pragma once

#define TOOLHOST_VERSION "1.0.0"
