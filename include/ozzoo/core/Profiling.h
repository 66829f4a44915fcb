#pragma once
// include/ozzoo/core/Profiling.h
//
// Tracy zones and frame marks. Both expand to nothing unless the build
// defines TRACY_ENABLE (OZZOO_ENABLE_TRACY=ON).

#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
  #define OZZOO_TRACY_ZONE(name_literal) ZoneScopedN(name_literal)
  #define OZZOO_FRAME_MARK FrameMark
#else
  #define OZZOO_TRACY_ZONE(name_literal)
  #define OZZOO_FRAME_MARK ((void)0)
#endif
