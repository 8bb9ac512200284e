#pragma once

// Sophon chunked-delta installer.
//
// Typical use:
//
//   sophon::build_info b (sophon::parse_build_info (vendor_response));
//   sophon::build_source s (
//     sophon::build_source::from (b, *b.find ("game")));
//
//   sophon::updater u (sophon::install (s, "/games/title"));
//
//   while (!u.snapshot ().finished ())
//     ...
//
//   sophon::install_result r (u.wait ());
//

#include <sophon/version.hxx>
#include <sophon/sophon-error.hxx>
#include <sophon/sophon-options.hxx>

#include <sophon/hash/hash.hxx>
#include <sophon/filesystem/destination.hxx>

#include <sophon/manifest/manifest-types.hxx>
#include <sophon/manifest/manifest-decoder.hxx>
#include <sophon/manifest/manifest-codec.hxx>
#include <sophon/manifest/manifest-schema.hxx>

#include <sophon/store/chunk-store.hxx>
#include <sophon/plan/plan-types.hxx>
#include <sophon/plan/planner.hxx>

#include <sophon/progress/progress-types.hxx>
#include <sophon/progress/progress-updater.hxx>

#include <sophon/sophon-installer.hxx>
