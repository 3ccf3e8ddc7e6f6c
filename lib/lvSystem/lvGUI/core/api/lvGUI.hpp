#pragma once

#include <lvGUI/core/api/Error.hpp>
#include <lvGUI/core/api/Types.hpp>
#include <lvGUI/core/api/Runtime.hpp>
#include <lvGUI/core/api/Obj.hpp>
#include <lvGUI/core/api/Style.hpp>
#include <lvGUI/display/Display.hpp>
#include <lvGUI/display/PanelFlush.hpp>
#include <lvGUI/input/InputDevice.hpp>
#include <lvGUI/input/Readers.hpp>
#include <lvGUI/widgets/Widgets.hpp>
