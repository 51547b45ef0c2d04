#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#endif

#include "voxcarve/engine.h"

#ifdef EMSCRIPTEN
EMSCRIPTEN_BINDINGS(voxcarve_engine_module) {
    emscripten::enum_<voxcarve::Face>("Face")
        .value("PlusX", voxcarve::Face::PlusX)
        .value("MinusX", voxcarve::Face::MinusX)
        .value("PlusY", voxcarve::Face::PlusY)
        .value("MinusY", voxcarve::Face::MinusY)
        .value("PlusZ", voxcarve::Face::PlusZ)
        .value("MinusZ", voxcarve::Face::MinusZ)
        .value("Ground", voxcarve::Face::Ground);

    emscripten::enum_<voxcarve::ToolMode>("ToolMode")
        .value("Paint", voxcarve::ToolMode::Paint)
        .value("Add", voxcarve::ToolMode::Add)
        .value("Carve", voxcarve::ToolMode::Carve);

    emscripten::enum_<voxcarve::ToolOption>("ToolOption")
        .value("Voxel", voxcarve::ToolOption::Voxel)
        .value("Row", voxcarve::ToolOption::Row)
        .value("Plane", voxcarve::ToolOption::Plane);

    emscripten::enum_<voxcarve::EngineError>("EngineError")
        .value("Ok", voxcarve::EngineError::Ok)
        .value("InvalidMagic", voxcarve::EngineError::InvalidMagic)
        .value("UnsupportedVersion", voxcarve::EngineError::UnsupportedVersion)
        .value("BufferTruncated", voxcarve::EngineError::BufferTruncated)
        .value("InvalidPayloadSize", voxcarve::EngineError::InvalidPayloadSize)
        .value("UnknownCommand", voxcarve::EngineError::UnknownCommand)
        .value("InvalidOperation", voxcarve::EngineError::InvalidOperation);

    emscripten::class_<CarveEngine>("CarveEngine")
        .constructor<>()
        .function("clear", &CarveEngine::clear)
        .function("allocBytes", &CarveEngine::allocBytes)
        .function("freeBytes", &CarveEngine::freeBytes)
        .function("applyCommandBuffer", &CarveEngine::applyCommandBuffer)
        .function("getLastError", &CarveEngine::getLastError)
        .function("getProtocolInfo", &CarveEngine::getProtocolInfo)
        // Grid
        .function("getSizeX", &CarveEngine::getSizeX)
        .function("getSizeY", &CarveEngine::getSizeY)
        .function("getSizeZ", &CarveEngine::getSizeZ)
        .function("getVoxelCount", &CarveEngine::getVoxelCount)
        .function("isSolid", &CarveEngine::isSolid)
        .function("getMaterial", &CarveEngine::getMaterial)
        .function("setVoxel", &CarveEngine::setVoxel)
        .function("fill", &CarveEngine::fill)
        .function("seedMaterials", &CarveEngine::seedMaterials)
        .function("resize", &CarveEngine::resize)
        .function("resetSize", &CarveEngine::resetSize)
        .function("shiftVoxels", &CarveEngine::shiftVoxels)
        .function("importVoxelRecords", &CarveEngine::importVoxelRecords)
        .function("exportVoxelRecords", &CarveEngine::exportVoxelRecords)
        // Regions
        .function("addRegion", &CarveEngine::addRegion)
        .function("removeRegion", &CarveEngine::removeRegion)
        .function("clearRegions", &CarveEngine::clearRegions)
        .function("getRegionCount", &CarveEngine::getRegionCount)
        .function("getRegionName", &CarveEngine::getRegionName)
        // Palette
        .function("setPaletteColor", &CarveEngine::setPaletteColor)
        .function("getPaletteColor", &CarveEngine::getPaletteColor)
        .function("getPalettePtr", &CarveEngine::getPalettePtr)
        // Buffers
        .function("getMainMeshMeta", &CarveEngine::getMainMeshMeta)
        .function("getRegionMeshMeta", &CarveEngine::getRegionMeshMeta)
        .function("getPickMeta", &CarveEngine::getPickMeta)
        .function("getGroundPickMeta", &CarveEngine::getGroundPickMeta)
        // Picking and tools
        .function("decodePick", &CarveEngine::decodePick)
        .function("toolTargets", &CarveEngine::toolTargets)
        .function("applyTool", &CarveEngine::applyTool)
        // History
        .function("getHistoryMeta", &CarveEngine::getHistoryMeta)
        .function("canUndo", &CarveEngine::canUndo)
        .function("canRedo", &CarveEngine::canRedo)
        .function("undo", &CarveEngine::undo)
        .function("redo", &CarveEngine::redo)
        .function("getUndoLabel", &CarveEngine::getUndoLabel)
        .function("getRedoLabel", &CarveEngine::getRedoLabel)
        .function("getDocumentDigest", &CarveEngine::getDocumentDigest)
        .function("getStats", &CarveEngine::getStats);

    emscripten::value_object<CarveEngine::ProtocolInfo>("ProtocolInfo")
        .field("protocolVersion", &CarveEngine::ProtocolInfo::protocolVersion)
        .field("commandVersion", &CarveEngine::ProtocolInfo::commandVersion)
        .field("pickFormatVersion", &CarveEngine::ProtocolInfo::pickFormatVersion)
        .field("abiHash", &CarveEngine::ProtocolInfo::abiHash)
        .field("featureFlags", &CarveEngine::ProtocolInfo::featureFlags);

    emscripten::value_object<voxcarve::PickHit>("PickHit")
        .field("voxel", &voxcarve::PickHit::voxel)
        .field("face", &voxcarve::PickHit::face);

    emscripten::value_object<voxcarve::RgbColor>("RgbColor")
        .field("r", &voxcarve::RgbColor::r)
        .field("g", &voxcarve::RgbColor::g)
        .field("b", &voxcarve::RgbColor::b);

    emscripten::value_object<CarveEngine::MeshBufferMeta>("MeshBufferMeta")
        .field("generation", &CarveEngine::MeshBufferMeta::generation)
        .field("vertexCount", &CarveEngine::MeshBufferMeta::vertexCount)
        .field("indexCount", &CarveEngine::MeshBufferMeta::indexCount)
        .field("positionsPtr", &CarveEngine::MeshBufferMeta::positionsPtr)
        .field("normalsPtr", &CarveEngine::MeshBufferMeta::normalsPtr)
        .field("materialsPtr", &CarveEngine::MeshBufferMeta::materialsPtr)
        .field("indicesPtr", &CarveEngine::MeshBufferMeta::indicesPtr);

    emscripten::value_object<CarveEngine::PickBufferMeta>("PickBufferMeta")
        .field("generation", &CarveEngine::PickBufferMeta::generation)
        .field("vertexCount", &CarveEngine::PickBufferMeta::vertexCount)
        .field("indexCount", &CarveEngine::PickBufferMeta::indexCount)
        .field("positionsPtr", &CarveEngine::PickBufferMeta::positionsPtr)
        .field("idsPtr", &CarveEngine::PickBufferMeta::idsPtr)
        .field("indicesPtr", &CarveEngine::PickBufferMeta::indicesPtr);

    emscripten::value_object<CarveEngine::DocumentDigest>("DocumentDigest")
        .field("lo", &CarveEngine::DocumentDigest::lo)
        .field("hi", &CarveEngine::DocumentDigest::hi);

    emscripten::value_object<CarveEngine::HistoryMeta>("HistoryMeta")
        .field("depth", &CarveEngine::HistoryMeta::depth)
        .field("cursor", &CarveEngine::HistoryMeta::cursor)
        .field("generation", &CarveEngine::HistoryMeta::generation);

    emscripten::value_object<CarveEngine::EngineStats>("EngineStats")
        .field("generation", &CarveEngine::EngineStats::generation)
        .field("voxelCount", &CarveEngine::EngineStats::voxelCount)
        .field("solidCount", &CarveEngine::EngineStats::solidCount)
        .field("regionCount", &CarveEngine::EngineStats::regionCount)
        .field("mainQuadCount", &CarveEngine::EngineStats::mainQuadCount)
        .field("regionQuadCount", &CarveEngine::EngineStats::regionQuadCount)
        .field("pickQuadCount", &CarveEngine::EngineStats::pickQuadCount)
        .field("rebuildCount", &CarveEngine::EngineStats::rebuildCount)
        .field("lastRebuildMs", &CarveEngine::EngineStats::lastRebuildMs)
        .field("lastApplyMs", &CarveEngine::EngineStats::lastApplyMs);

    emscripten::register_vector<std::uint32_t>("VectorUInt32");
    emscripten::register_vector<std::string>("VectorString");
}
#endif
