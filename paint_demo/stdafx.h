// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose:
//

#pragma once

#include <cstdio>
#include <cmath>

#include <utility>
#include <vector>
#include <array>
#include <memory>
#include <algorithm>
#include <string>
#include <optional>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <SDL.h>

#include <texpaint/texpaint.h>
