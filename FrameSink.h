#ifndef FRAME_SINK_H
#define FRAME_SINK_H

class FrameBuffer;

// Display transport: pushes one fully composed frame.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Synchronous. Returns false if the frame could not be delivered.
    virtual bool Submit(const FrameBuffer& frame) = 0;
};

#endif // FRAME_SINK_H
