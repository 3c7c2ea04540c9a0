#pragma once

#include <string>

#include "internal/util/object_id.hpp"

namespace pbxpatch::testing {

/*
  A small single-target iOS project:

    <main group>
      App/            AppDelegate.swift, Info.plist, Localizable.strings (variant)
      Features/
        Chat/         ChatView.swift
      Products/       DemoApp.app

  Target "DemoApp" builds AppDelegate.swift and ChatView.swift in its
  Sources phase.
*/
inline const std::string kSampleDescriptor = R"pbx(// !$*UTF8*$!
{
	archiveVersion = 1;
	classes = {
	};
	objectVersion = 56;
	objects = {

/* Begin PBXBuildFile section */
		1D0000000000000000000030 /* AppDelegate.swift in Sources */ = {isa = PBXBuildFile; fileRef = 1D0000000000000000000020 /* AppDelegate.swift */; };
		1D0000000000000000000031 /* ChatView.swift in Sources */ = {isa = PBXBuildFile; fileRef = 1D0000000000000000000021 /* ChatView.swift */; };
		1D0000000000000000000032 /* Localizable.strings in Resources */ = {isa = PBXBuildFile; fileRef = 1D0000000000000000000015 /* Localizable.strings */; };
/* End PBXBuildFile section */

/* Begin PBXFileReference section */
		1D0000000000000000000020 /* AppDelegate.swift */ = {isa = PBXFileReference; lastKnownFileType = sourcecode.swift; path = AppDelegate.swift; sourceTree = "<group>"; };
		1D0000000000000000000021 /* ChatView.swift */ = {isa = PBXFileReference; lastKnownFileType = sourcecode.swift; path = ChatView.swift; sourceTree = "<group>"; };
		1D0000000000000000000022 /* Info.plist */ = {isa = PBXFileReference; lastKnownFileType = text.plist.xml; path = Info.plist; sourceTree = "<group>"; };
		1D0000000000000000000023 /* en */ = {isa = PBXFileReference; lastKnownFileType = text.plist.strings; name = en; path = en.lproj/Localizable.strings; sourceTree = "<group>"; };
		1D0000000000000000000024 /* DemoApp.app */ = {isa = PBXFileReference; explicitFileType = wrapper.application; includeInIndex = 0; path = DemoApp.app; sourceTree = BUILT_PRODUCTS_DIR; };
/* End PBXFileReference section */

/* Begin PBXFrameworksBuildPhase section */
		1D0000000000000000000041 /* Frameworks */ = {
			isa = PBXFrameworksBuildPhase;
			buildActionMask = 2147483647;
			files = (
			);
			runOnlyForDeploymentPostprocessing = 0;
		};
/* End PBXFrameworksBuildPhase section */

/* Begin PBXGroup section */
		1D0000000000000000000010 = {
			isa = PBXGroup;
			children = (
				1D0000000000000000000011 /* App */,
				1D0000000000000000000012 /* Features */,
				1D0000000000000000000014 /* Products */,
			);
			sourceTree = "<group>";
		};
		1D0000000000000000000011 /* App */ = {
			isa = PBXGroup;
			children = (
				1D0000000000000000000020 /* AppDelegate.swift */,
				1D0000000000000000000022 /* Info.plist */,
				1D0000000000000000000015 /* Localizable.strings */,
			);
			path = App;
			sourceTree = "<group>";
		};
		1D0000000000000000000012 /* Features */ = {
			isa = PBXGroup;
			children = (
				1D0000000000000000000013 /* Chat */,
			);
			path = Features;
			sourceTree = "<group>";
		};
		1D0000000000000000000013 /* Chat */ = {
			isa = PBXGroup;
			children = (
				1D0000000000000000000021 /* ChatView.swift */,
			);
			path = Chat;
			sourceTree = "<group>";
		};
		1D0000000000000000000014 /* Products */ = {
			isa = PBXGroup;
			children = (
				1D0000000000000000000024 /* DemoApp.app */,
			);
			name = Products;
			sourceTree = "<group>";
		};
/* End PBXGroup section */

/* Begin PBXNativeTarget section */
		1D0000000000000000000050 /* DemoApp */ = {
			isa = PBXNativeTarget;
			buildConfigurationList = 1D0000000000000000000063 /* Build configuration list for PBXNativeTarget "DemoApp" */;
			buildPhases = (
				1D0000000000000000000040 /* Sources */,
				1D0000000000000000000041 /* Frameworks */,
				1D0000000000000000000042 /* Resources */,
			);
			buildRules = (
			);
			dependencies = (
			);
			name = DemoApp;
			productName = DemoApp;
			productReference = 1D0000000000000000000024 /* DemoApp.app */;
			productType = "com.apple.product-type.application";
		};
/* End PBXNativeTarget section */

/* Begin PBXProject section */
		1D0000000000000000000001 /* Project object */ = {
			isa = PBXProject;
			attributes = {
				LastSwiftUpdateCheck = 1500;
				TargetAttributes = {
					1D0000000000000000000050 = {
						CreatedOnToolsVersion = 15.0;
					};
				};
			};
			buildConfigurationList = 1D0000000000000000000060 /* Build configuration list for PBXProject "DemoApp" */;
			compatibilityVersion = "Xcode 14.0";
			developmentRegion = en;
			hasScannedForEncodings = 0;
			knownRegions = (
				en,
				Base,
			);
			mainGroup = 1D0000000000000000000010;
			productRefGroup = 1D0000000000000000000014 /* Products */;
			projectDirPath = "";
			projectRoot = "";
			targets = (
				1D0000000000000000000050 /* DemoApp */,
			);
		};
/* End PBXProject section */

/* Begin PBXResourcesBuildPhase section */
		1D0000000000000000000042 /* Resources */ = {
			isa = PBXResourcesBuildPhase;
			buildActionMask = 2147483647;
			files = (
				1D0000000000000000000032 /* Localizable.strings in Resources */,
			);
			runOnlyForDeploymentPostprocessing = 0;
		};
/* End PBXResourcesBuildPhase section */

/* Begin PBXSourcesBuildPhase section */
		1D0000000000000000000040 /* Sources */ = {
			isa = PBXSourcesBuildPhase;
			buildActionMask = 2147483647;
			files = (
				1D0000000000000000000030 /* AppDelegate.swift in Sources */,
				1D0000000000000000000031 /* ChatView.swift in Sources */,
			);
			runOnlyForDeploymentPostprocessing = 0;
		};
/* End PBXSourcesBuildPhase section */

/* Begin PBXVariantGroup section */
		1D0000000000000000000015 /* Localizable.strings */ = {
			isa = PBXVariantGroup;
			children = (
				1D0000000000000000000023 /* en */,
			);
			name = Localizable.strings;
			sourceTree = "<group>";
		};
/* End PBXVariantGroup section */

/* Begin XCBuildConfiguration section */
		1D0000000000000000000061 /* Debug */ = {
			isa = XCBuildConfiguration;
			buildSettings = {
				ONLY_ACTIVE_ARCH = YES;
				SDKROOT = iphoneos;
			};
			name = Debug;
		};
		1D0000000000000000000062 /* Release */ = {
			isa = XCBuildConfiguration;
			buildSettings = {
				SDKROOT = iphoneos;
				VALIDATE_PRODUCT = YES;
			};
			name = Release;
		};
		1D0000000000000000000064 /* Debug */ = {
			isa = XCBuildConfiguration;
			buildSettings = {
				INFOPLIST_FILE = App/Info.plist;
				PRODUCT_BUNDLE_IDENTIFIER = com.example.DemoApp;
				PRODUCT_NAME = "$(TARGET_NAME)";
				SWIFT_VERSION = 5.0;
			};
			name = Debug;
		};
		1D0000000000000000000065 /* Release */ = {
			isa = XCBuildConfiguration;
			buildSettings = {
				INFOPLIST_FILE = App/Info.plist;
				PRODUCT_BUNDLE_IDENTIFIER = com.example.DemoApp;
				PRODUCT_NAME = "$(TARGET_NAME)";
				SWIFT_VERSION = 5.0;
			};
			name = Release;
		};
/* End XCBuildConfiguration section */

/* Begin XCConfigurationList section */
		1D0000000000000000000060 /* Build configuration list for PBXProject "DemoApp" */ = {
			isa = XCConfigurationList;
			buildConfigurations = (
				1D0000000000000000000061 /* Debug */,
				1D0000000000000000000062 /* Release */,
			);
			defaultConfigurationIsVisible = 0;
			defaultConfigurationName = Release;
		};
		1D0000000000000000000063 /* Build configuration list for PBXNativeTarget "DemoApp" */ = {
			isa = XCConfigurationList;
			buildConfigurations = (
				1D0000000000000000000064 /* Debug */,
				1D0000000000000000000065 /* Release */,
			);
			defaultConfigurationIsVisible = 0;
			defaultConfigurationName = Release;
		};
/* End XCConfigurationList section */
	};
	rootObject = 1D0000000000000000000001 /* Project object */;
}
)pbx";

inline const std::string kMainGroupId     = "1D0000000000000000000010";
inline const std::string kAppGroupId      = "1D0000000000000000000011";
inline const std::string kFeaturesGroupId = "1D0000000000000000000012";
inline const std::string kChatGroupId     = "1D0000000000000000000013";
inline const std::string kProductsGroupId = "1D0000000000000000000014";
inline const std::string kVariantGroupId  = "1D0000000000000000000015";
inline const std::string kAppDelegateRef  = "1D0000000000000000000020";
inline const std::string kChatViewRef     = "1D0000000000000000000021";
inline const std::string kSourcesPhaseId  = "1D0000000000000000000040";
inline const std::string kResourcesPhase  = "1D0000000000000000000042";
inline const std::string kTargetId        = "1D0000000000000000000050";

// Hands out AA0000000000000000000001, AA0000000000000000000002, ...
class SequentialIdGenerator final : public util::ObjectIdGenerator {
 public:
  int Drawn() const {
    return next_ - 1;
  }

 protected:
  std::string Draw() override {
    std::string id = std::to_string(next_++);
    return "AA" + std::string(util::kObjectIdLength - 2 - id.size(), '0') + id;
  }

 private:
  int next_ = 1;
};

inline std::string SequentialId(int n) {
  std::string id = std::to_string(n);
  return "AA" + std::string(util::kObjectIdLength - 2 - id.size(), '0') + id;
}

} // namespace pbxpatch::testing
