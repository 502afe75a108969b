#include "safemeta/metadata_model.h"

namespace safemeta {

const char*
color_model_name(ColorModel model) noexcept
{
    switch (model) {
    case ColorModel::Unknown: return "unknown";
    case ColorModel::Rgb: return "RGB";
    case ColorModel::Gray: return "Gray";
    case ColorModel::Cmyk: return "CMYK";
    case ColorModel::Lab: return "Lab";
    }
    return "unknown";
}


bool
is_empty(const MetadataModel& model) noexcept
{
    return !model.orientation && !model.pixel_width && !model.pixel_height
           && model.color_model == ColorModel::Unknown && !model.resolution
           && !model.gps && !model.device && !model.timestamps
           && !model.camera_settings && !model.caption;
}

}  // namespace safemeta
