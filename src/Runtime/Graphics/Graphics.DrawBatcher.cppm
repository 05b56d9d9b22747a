module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <variant>
#include <vector>

export module Graphics:DrawBatcher;

import Core;
import RHI;
import :VisualRecord;
import :InstanceLayout;
import :InstanceStream;
import :SpriteSheet;
import :TextureRegistry;

export namespace Graphics
{
    struct BatcherConfig
    {
        float LayerBucketSize = 1.0f;
        uint32_t StreamEvictionFrames = 60;
    };

    struct BatchKey
    {
        PipelineKind Kind = PipelineKind::Sprite;
        TextureId Texture = kPlaceholderTexture;
        int32_t LayerBucket = 0;
        ScissorId Scissor = kNoScissor;

        bool operator==(const BatchKey&) const = default;
    };

    struct BatchKeyHash
    {
        size_t operator()(const BatchKey& key) const noexcept
        {
            size_t h = std::hash<uint32_t>{}(static_cast<uint32_t>(key.Kind));
            h ^= std::hash<uint32_t>{}(key.Texture) + 0x9e3779b9 + (h << 6) + (h >> 2);
            h ^= std::hash<int32_t>{}(key.LayerBucket) + 0x9e3779b9 + (h << 6) + (h >> 2);
            h ^= std::hash<uint32_t>{}(key.Scissor) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }
    };

    // Draw order: world kinds before screen kinds, then layer bucket, then
    // kind (Sprite < UIRect < UIImage < Glyph), then texture, then scissor.
    [[nodiscard]] bool DrawsBefore(const BatchKey& a, const BatchKey& b);

    // The instance stream of one batch key. Sprite keys stream SpriteInstance,
    // UIImage keys UiImageInstance, UI rect and glyph keys UiRectInstance.
    class BatchStream
    {
    public:
        explicit BatchStream(PipelineKind kind);

        void Reset();
        void Push(const SpriteInstance& instance);
        void Push(const UiRectInstance& instance);
        void Push(const UiImageInstance& instance);

        // Appends every record to target, which must stream the same kind,
        // with sheet indices reset to 0. Leaves this stream empty.
        size_t MoveInto(BatchStream& target);
        // Removes records whose sheet index sheet cannot address.
        size_t DropInvalidIndices(const SpriteSheetDescriptor& sheet);

        [[nodiscard]] size_t Size() const;
        [[nodiscard]] size_t DeviceCapacity() const;
        [[nodiscard]] RHI::BufferHandle GetBuffer() const;
        [[nodiscard]] uint64_t GetReallocationCount() const;

        [[nodiscard]] Core::Result Upload(RHI::IRenderDevice& device);
        [[nodiscard]] Core::Result ShrinkToFit(RHI::IRenderDevice& device);
        void Release(RHI::IRenderDevice& device);

        [[nodiscard]] const InstanceStream<SpriteInstance>* Sprites() const;
        [[nodiscard]] const InstanceStream<UiRectInstance>* Rects() const;
        [[nodiscard]] const InstanceStream<UiImageInstance>* Images() const;

    private:
        std::variant<InstanceStream<SpriteInstance>,
                     InstanceStream<UiRectInstance>,
                     InstanceStream<UiImageInstance>> m_Stream;
    };

    struct Batch
    {
        BatchKey Key;
        BatchStream* Stream = nullptr;

        [[nodiscard]] uint32_t InstanceCount() const { return static_cast<uint32_t>(Stream->Size()); }
    };

    struct BatcherStats
    {
        uint32_t Submitted = 0;
        uint32_t Accepted = 0;
        uint32_t DroppedUnknownKind = 0;
        uint32_t DroppedOutOfRange = 0;
        uint32_t DroppedInvalidLayer = 0;
        uint32_t Substituted = 0;
        uint32_t Batches = 0;
        uint32_t LiveStreams = 0;
    };

    // Groups one frame's visual records by BatchKey into instance streams.
    //
    //   Begin -> Submit* -> End -> GetBatches
    //
    // Streams persist across frames so their capacity is reused; their
    // contents never do. A stream that receives nothing for
    // StreamEvictionFrames frames is released at End.
    //
    // End re-checks every texture whose generation moved since Submit:
    // records of an unregistered texture move to the placeholder, records
    // of a replaced one are re-validated against its new sheet.
    class DrawBatcher
    {
    public:
        explicit DrawBatcher(BatcherConfig config = {});
        DrawBatcher(const DrawBatcher&) = delete;
        DrawBatcher& operator=(const DrawBatcher&) = delete;

        void Begin();
        // Returns false when the record was dropped.
        bool Submit(const TextureRegistry& textures, const VisualRecord& record);
        void End(RHI::IRenderDevice& device, const TextureRegistry& textures);

        // Frees every stream's device buffer.
        void Release(RHI::IRenderDevice& device);

        [[nodiscard]] const std::vector<Batch>& GetBatches() const { return m_Batches; }
        [[nodiscard]] const BatcherStats& GetStats() const { return m_Stats; }
        [[nodiscard]] const BatcherConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] uint64_t GetFrameIndex() const { return m_FrameIndex; }

        [[nodiscard]] int32_t ComputeLayerBucket(float layer) const;

    private:
        struct StreamSlot
        {
            std::unique_ptr<BatchStream> Stream;
            uint64_t LastUsedFrame = 0;
            uint32_t Generation = 0; // texture generation at the frame's first record
        };

        StreamSlot& AcquireSlot(const BatchKey& key, const TextureRegistry& textures);
        void Revalidate(const TextureRegistry& textures);
        void ReportDrops() const;

        BatcherConfig m_Config;
        std::unordered_map<BatchKey, StreamSlot, BatchKeyHash> m_Slots;
        std::vector<Batch> m_Batches;
        std::vector<BatchKey> m_StaleKeys;
        BatcherStats m_Stats;
        uint64_t m_FrameIndex = 0;
        bool m_InFrame = false;
    };
}
