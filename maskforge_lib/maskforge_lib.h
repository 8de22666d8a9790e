#pragma once

#include "maskforge_log.h"
#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_2d.h"
#include "maskforge_geometry.h"
#include "maskforge_image.h"
#include "maskforge_image_io.h"
#include "maskforge_compositor.h"
#include "maskforge_gerber.h"
#include "maskforge_gds.h"
#include "maskforge_adapters.h"
#include "maskforge_render.h"
