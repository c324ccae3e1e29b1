#pragma once

#include <rtk/core/Error.hpp>
#include <rtk/ui/BackingStore.hpp>
#include <rtk/ui/Cursor.hpp>
#include <rtk/ui/Event.hpp>
#include <rtk/ui/HostSurface.hpp>
#include <rtk/ui/NativeWindow.hpp>
#include <rtk/ui/ReflowScheduler.hpp>
#include <rtk/ui/RuntimeConfig.hpp>
#include <rtk/ui/Widget.hpp>
#include <rtk/ui/Window.hpp>
#include <rtk/ui/WindowAttributes.hpp>
