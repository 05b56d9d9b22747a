module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

module Graphics:DrawBatcher.Impl;

import :DrawBatcher;
import :InstanceLayout;
import :InstanceStream;
import :SpriteSheet;
import :TextureRegistry;
import :VisualRecord;
import Core;
import RHI;

namespace Graphics
{
    bool DrawsBefore(const BatchKey& a, const BatchKey& b)
    {
        const auto rank = [](const BatchKey& k)
        {
            return std::make_tuple(IsScreenSpace(k.Kind) ? 1 : 0,
                                   k.LayerBucket,
                                   KindDrawPriority(k.Kind),
                                   k.Texture,
                                   k.Scissor);
        };
        return rank(a) < rank(b);
    }

    // ---------------------------------------------------------------------
    // BatchStream
    // ---------------------------------------------------------------------

    namespace
    {
        template <typename T>
        concept HasSheetIndex = requires(T instance) { instance.Index; };

        std::variant<InstanceStream<SpriteInstance>,
                     InstanceStream<UiRectInstance>,
                     InstanceStream<UiImageInstance>> MakeStream(PipelineKind kind)
        {
            if (kind == PipelineKind::Sprite) return InstanceStream<SpriteInstance>{};
            if (kind == PipelineKind::UIImage) return InstanceStream<UiImageInstance>{};
            return InstanceStream<UiRectInstance>{};
        }

        SpriteInstance ToSpriteInstance(const VisualRecord& record)
        {
            return SpriteInstance{
                .PosScale = {record.Position.x, record.Position.y, record.Layer, record.Scale.x},
                .ScaleY = record.Scale.y,
                .Index = record.SpriteIndex,
                .Flip = record.Flip ? 1u : 0u
            };
        }

        UiRectInstance ToRectInstance(const VisualRecord& record)
        {
            return UiRectInstance{
                .X = record.Position.x,
                .Y = record.Position.y,
                .W = record.Scale.x,
                .H = record.Scale.y,
                .Color = record.Color,
                .Layer = UiLayerToDepth(record.Layer),
                .Radius = record.CornerRadius,
                .Outline = record.OutlineColor
            };
        }

        UiImageInstance ToImageInstance(const VisualRecord& record)
        {
            return UiImageInstance{
                .X = record.Position.x,
                .Y = record.Position.y,
                .W = record.Scale.x,
                .H = record.Scale.y,
                .Layer = UiLayerToDepth(record.Layer),
                .Index = record.SpriteIndex,
                .Flip = record.Flip ? 1u : 0u,
                .Color = record.Color
            };
        }
    }

    BatchStream::BatchStream(PipelineKind kind)
        : m_Stream(MakeStream(kind))
    {
    }

    void BatchStream::Reset()
    {
        std::visit([](auto& stream) { stream.Reset(); }, m_Stream);
    }

    void BatchStream::Push(const SpriteInstance& instance)
    {
        std::get<InstanceStream<SpriteInstance>>(m_Stream).Push(instance);
    }

    void BatchStream::Push(const UiRectInstance& instance)
    {
        std::get<InstanceStream<UiRectInstance>>(m_Stream).Push(instance);
    }

    void BatchStream::Push(const UiImageInstance& instance)
    {
        std::get<InstanceStream<UiImageInstance>>(m_Stream).Push(instance);
    }

    size_t BatchStream::MoveInto(BatchStream& target)
    {
        const size_t moved = std::visit([&](auto& source) -> size_t
        {
            auto& destination = std::get<std::decay_t<decltype(source)>>(target.m_Stream);
            for (auto record : source.Records())
            {
                if constexpr (HasSheetIndex<decltype(record)>) record.Index = 0;
                destination.Push(record);
            }
            return source.Size();
        }, m_Stream);
        Reset();
        return moved;
    }

    size_t BatchStream::DropInvalidIndices(const SpriteSheetDescriptor& sheet)
    {
        return std::visit([&](auto& stream) -> size_t
        {
            return stream.EraseIf([&](const auto& record)
            {
                if constexpr (HasSheetIndex<std::decay_t<decltype(record)>>) return !sheet.IsIndexValid(record.Index);
                else return false;
            });
        }, m_Stream);
    }

    size_t BatchStream::Size() const
    {
        return std::visit([](const auto& stream) { return stream.Size(); }, m_Stream);
    }

    size_t BatchStream::DeviceCapacity() const
    {
        return std::visit([](const auto& stream) { return stream.DeviceCapacity(); }, m_Stream);
    }

    RHI::BufferHandle BatchStream::GetBuffer() const
    {
        return std::visit([](const auto& stream) { return stream.GetBuffer(); }, m_Stream);
    }

    uint64_t BatchStream::GetReallocationCount() const
    {
        return std::visit([](const auto& stream) { return stream.GetReallocationCount(); }, m_Stream);
    }

    Core::Result BatchStream::Upload(RHI::IRenderDevice& device)
    {
        return std::visit([&](auto& stream) { return stream.Upload(device, "BatchInstances"); }, m_Stream);
    }

    Core::Result BatchStream::ShrinkToFit(RHI::IRenderDevice& device)
    {
        return std::visit([&](auto& stream) { return stream.ShrinkToFit(device, "BatchInstances"); }, m_Stream);
    }

    void BatchStream::Release(RHI::IRenderDevice& device)
    {
        std::visit([&](auto& stream) { stream.Release(device); }, m_Stream);
    }

    const InstanceStream<SpriteInstance>* BatchStream::Sprites() const
    {
        return std::get_if<InstanceStream<SpriteInstance>>(&m_Stream);
    }

    const InstanceStream<UiRectInstance>* BatchStream::Rects() const
    {
        return std::get_if<InstanceStream<UiRectInstance>>(&m_Stream);
    }

    const InstanceStream<UiImageInstance>* BatchStream::Images() const
    {
        return std::get_if<InstanceStream<UiImageInstance>>(&m_Stream);
    }

    // ---------------------------------------------------------------------
    // DrawBatcher
    // ---------------------------------------------------------------------

    DrawBatcher::DrawBatcher(BatcherConfig config)
        : m_Config(config)
    {
        if (!(m_Config.LayerBucketSize > 0.0f))
        {
            Core::Log::Warn("DrawBatcher: LayerBucketSize {} is not positive, using 1.0", m_Config.LayerBucketSize);
            m_Config.LayerBucketSize = 1.0f;
        }
    }

    int32_t DrawBatcher::ComputeLayerBucket(float layer) const
    {
        // Computed in double so the int32 limits are exact clamp bounds.
        const double bucket = std::floor(static_cast<double>(layer) / m_Config.LayerBucketSize);
        if (std::isnan(bucket)) return 0;
        return static_cast<int32_t>(std::clamp(bucket,
                                               static_cast<double>(std::numeric_limits<int32_t>::min()),
                                               static_cast<double>(std::numeric_limits<int32_t>::max())));
    }

    void DrawBatcher::Begin()
    {
        ++m_FrameIndex;
        for (auto& [key, slot] : m_Slots) slot.Stream->Reset();
        m_Batches.clear();
        m_Stats = {};
        m_InFrame = true;
    }

    bool DrawBatcher::Submit(const TextureRegistry& textures, const VisualRecord& record)
    {
        if (!m_InFrame) Begin();
        ++m_Stats.Submitted;

        if (!IsKnownKind(record.Kind))
        {
            ++m_Stats.DroppedUnknownKind;
            return false;
        }

        if (!std::isfinite(record.Layer))
        {
            ++m_Stats.DroppedInvalidLayer;
            return false;
        }

        BatchKey key{
            .Kind = record.Kind,
            .Texture = record.Texture,
            .LayerBucket = ComputeLayerBucket(record.Layer),
            .Scissor = IsScreenSpace(record.Kind) ? record.Scissor : kNoScissor
        };

        uint32_t spriteIndex = record.SpriteIndex;

        if (record.Kind == PipelineKind::UIRect)
        {
            // Plain rects never sample; keep them in one batch per layer.
            key.Texture = kPlaceholderTexture;
        }
        else if (!textures.Contains(key.Texture))
        {
            ++m_Stats.Substituted;
            key.Texture = kPlaceholderTexture;
            spriteIndex = 0;
        }

        if (UsesSheetIndex(record.Kind))
        {
            const SpriteSheetDescriptor* sheet = textures.GetSheet(key.Texture);
            if (!sheet || !sheet->IsIndexValid(spriteIndex))
            {
                ++m_Stats.DroppedOutOfRange;
                return false;
            }
        }

        StreamSlot& slot = AcquireSlot(key, textures);
        if (record.Kind == PipelineKind::Sprite)
        {
            SpriteInstance instance = ToSpriteInstance(record);
            instance.Index = spriteIndex;
            slot.Stream->Push(instance);
        }
        else if (record.Kind == PipelineKind::UIImage)
        {
            UiImageInstance instance = ToImageInstance(record);
            instance.Index = spriteIndex;
            slot.Stream->Push(instance);
        }
        else
        {
            slot.Stream->Push(ToRectInstance(record));
        }

        ++m_Stats.Accepted;
        return true;
    }

    DrawBatcher::StreamSlot& DrawBatcher::AcquireSlot(const BatchKey& key, const TextureRegistry& textures)
    {
        auto [it, inserted] = m_Slots.try_emplace(key);
        StreamSlot& slot = it->second;
        if (inserted) slot.Stream = std::make_unique<BatchStream>(key.Kind);
        if (slot.Stream->Size() == 0) slot.Generation = textures.GetGeneration(key.Texture).value_or(0);
        slot.LastUsedFrame = m_FrameIndex;
        return slot;
    }

    void DrawBatcher::Revalidate(const TextureRegistry& textures)
    {
        m_StaleKeys.clear();
        for (const auto& [key, slot] : m_Slots)
        {
            if (key.Kind == PipelineKind::UIRect || slot.Stream->Size() == 0) continue;
            if (textures.GetGeneration(key.Texture) != slot.Generation) m_StaleKeys.push_back(key);
        }

        for (const BatchKey& key : m_StaleKeys)
        {
            // Element references survive the rehash AcquireSlot may trigger.
            StreamSlot& slot = m_Slots.at(key);

            if (const auto generation = textures.GetGeneration(key.Texture))
            {
                if (UsesSheetIndex(key.Kind))
                {
                    const auto dropped = static_cast<uint32_t>(
                        slot.Stream->DropInvalidIndices(*textures.GetSheet(key.Texture)));
                    m_Stats.DroppedOutOfRange += dropped;
                    m_Stats.Accepted -= dropped;
                }
                slot.Generation = *generation;
                continue;
            }

            BatchKey fallback = key;
            fallback.Texture = kPlaceholderTexture;
            StreamSlot& target = AcquireSlot(fallback, textures);
            m_Stats.Substituted += static_cast<uint32_t>(slot.Stream->MoveInto(*target.Stream));
        }
    }

    void DrawBatcher::End(RHI::IRenderDevice& device, const TextureRegistry& textures)
    {
        if (!m_InFrame) Begin();
        m_InFrame = false;

        Revalidate(textures);

        for (auto it = m_Slots.begin(); it != m_Slots.end();)
        {
            StreamSlot& slot = it->second;
            if (slot.Stream->Size() > 0)
            {
                m_Batches.push_back({it->first, slot.Stream.get()});
            }
            else if (m_FrameIndex - slot.LastUsedFrame >= m_Config.StreamEvictionFrames)
            {
                slot.Stream->Release(device);
                it = m_Slots.erase(it);
                continue;
            }
            ++it;
        }

        std::sort(m_Batches.begin(), m_Batches.end(),
                  [](const Batch& a, const Batch& b) { return DrawsBefore(a.Key, b.Key); });

        m_Stats.Batches = static_cast<uint32_t>(m_Batches.size());
        m_Stats.LiveStreams = static_cast<uint32_t>(m_Slots.size());
        ReportDrops();
    }

    void DrawBatcher::Release(RHI::IRenderDevice& device)
    {
        for (auto& [key, slot] : m_Slots) slot.Stream->Release(device);
        m_Slots.clear();
        m_Batches.clear();
        m_InFrame = false;
    }

    void DrawBatcher::ReportDrops() const
    {
        if (m_Stats.DroppedUnknownKind > 0)
            Core::Log::Warn("DrawBatcher: dropped {} record(s) with an unknown pipeline kind", m_Stats.DroppedUnknownKind);
        if (m_Stats.DroppedInvalidLayer > 0)
            Core::Log::Warn("DrawBatcher: dropped {} record(s) with a non-finite layer", m_Stats.DroppedInvalidLayer);
        if (m_Stats.DroppedOutOfRange > 0)
            Core::Log::Warn("DrawBatcher: dropped {} sprite(s) with an out-of-range sprite index", m_Stats.DroppedOutOfRange);
        if (m_Stats.Substituted > 0)
            Core::Log::Warn("DrawBatcher: {} record(s) referenced a missing texture, using placeholder", m_Stats.Substituted);
    }
}
