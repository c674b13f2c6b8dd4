#include "bundle/manifest_renderer.hpp"

namespace bundler {

namespace {

// WiX v3 product definition. The harvested fragment (heat output) supplies
// the component group referenced by the feature.
constexpr std::string_view kMainWxs = R"WXS(<?xml version="1.0" encoding="utf-8"?>
<Wix xmlns="http://schemas.microsoft.com/wix/2006/wi">
  <Product Id="*"
           Name="{{ product_name }}"
           UpgradeCode="{{ upgrade_code }}"
           Language="1033"
           Codepage="1252"
           Version="{{ product_version }}"
           Manufacturer="{{ manufacturer }}">

    <Package InstallerVersion="450"
             Compressed="yes"
             InstallScope="perMachine"
             Platform="{{ arch }}" />

    <MajorUpgrade DowngradeErrorMessage="A newer version of [ProductName] is already installed." />
    <MediaTemplate EmbedCab="yes" />

    <Directory Id="TARGETDIR" Name="SourceDir">
      <Directory Id="{{ program_files_folder }}">
        <Directory Id="{{ directory_ref }}" Name="{{ product_name }}" />
      </Directory>
    </Directory>

    <Feature Id="MainFeature" Title="{{ product_name }}" Level="1">
      <ComponentGroupRef Id="{{ component_group }}" />
    </Feature>
  </Product>
</Wix>
)WXS";

} // namespace

std::string_view DefaultManifestTemplate() { return kMainWxs; }

} // namespace bundler
